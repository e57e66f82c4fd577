#include "models.h"

namespace storage {

const char* WriteKindName(WriteKind kind) {
  return kind == WriteKind::kPut ? "PutRequest" : "DeleteRequest";
}

}  // namespace storage
