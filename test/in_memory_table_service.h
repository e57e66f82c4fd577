#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../dynrep/storage/table_service.h"

namespace testing_support {

storage::Item MakeItem(const std::vector<std::pair<std::string, std::string>>& string_attrs);
std::string GetS(const storage::Item& item, const std::string& attr);

struct AppliedWrite {
  uint64_t seq = 0;
  std::string table;
  storage::WriteKind kind = storage::WriteKind::kPut;
  std::string key;
};

// In-memory stand-in for DynamoDB. Items are ordered by their key, scans split
// the key space by a hash of the partition key, and pages honor a limit with a
// key-based continuation token so concurrent deletes do not skip items.
class InMemoryTableService : public storage::ITableService {
 public:
  void CreateTable(const std::string& table, storage::KeySchema keys);
  void AddIndex(const std::string& table, const std::string& index_name, storage::KeySchema keys);
  void PutItems(const std::string& table, const std::vector<storage::Item>& items);
  std::vector<storage::Item> Items(const std::string& table) const;
  bool HasTable(const std::string& table) const;

  void SetScanPageLimit(size_t limit) { scan_page_limit_ = limit; }
  // Each BatchWrite call pops one entry and leaves that many trailing intents unapplied.
  void ScriptUnprocessed(std::vector<size_t> counts);
  // Each BatchWrite call pops one entry and fails the whole call with that status.
  void ScriptWriteStatus(std::vector<int> statuses);
  void FailScanSegment(int segment) { failing_segment_ = segment; }

  // Scans log as "scan:<table>:<segment>/<total>", with ":consistent" appended
  // for strongly consistent reads.
  std::vector<std::string> CallLog() const;
  void ClearCallLog();
  std::vector<AppliedWrite> AppliedWrites() const;
  std::vector<size_t> BatchSizes() const;

  storage::KeySchema DescribeKeySchema(const std::string& table) override;
  storage::KeySchema DescribeIndexKeySchema(const std::string& table, const std::string& index_name) override;
  storage::Page Scan(const storage::ScanPageRequest& req) override;
  storage::Page Query(const storage::QueryPageRequest& req) override;
  storage::BatchWriteResult BatchWrite(const std::string& table,
                                       const std::vector<storage::WriteIntent>& intents) override;
  storage::BackupInfo CreateBackup(const std::string& table, const std::string& backup_name) override;
  void DeleteTable(const std::string& table) override;

 private:
  struct Table {
    storage::KeySchema keys;
    std::map<std::string, storage::KeySchema> indexes;
    std::map<std::string, storage::Item> rows;
  };

  Table& TableLocked(const std::string& table);
  const Table& TableLocked(const std::string& table) const;
  static std::string RowKey(const Table& t, const storage::Item& item);
  static storage::Item KeyItem(const Table& t, const storage::Item& item);
  void LogLocked(const std::string& entry);

  mutable std::mutex mu_;
  std::map<std::string, Table> tables_;
  size_t scan_page_limit_ = 1000;
  std::deque<size_t> unprocessed_script_;
  std::deque<int> status_script_;
  std::optional<int> failing_segment_;
  std::vector<std::string> call_log_;
  std::vector<AppliedWrite> applied_;
  std::vector<size_t> batch_sizes_;
  uint64_t next_seq_ = 1;
};

}  // namespace testing_support
