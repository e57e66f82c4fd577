// dynrep_cli.cpp
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <aws/core/Aws.h>

#include "../config/replica_config.h"
#include "cli/args.h"
#include "protocol/encode_json.h"
#include "replication/replicator.h"
#include "replication/table_handle.h"
#include "replication/worker_pool.h"
#include "storage/errors.h"
#include "storage/table_service_factory.h"
#include "util/log.h"

using namespace std;

static constexpr int kExitOk = 0;
static constexpr int kExitError = 1;
static constexpr int kExitUsage = 2;

static const char* kUsage =
    "Usage:\n"
    "  dynrep copy    -t TABLE -src ENV -tgt ENV [-pk VALUE [-sk PREFIX] [-i INDEX]]\n"
    "  dynrep query   -t TABLE -e ENV -pk VALUE [-sk PREFIX] [-i INDEX] [-u ATTR] [-head]\n"
    "                 [-f ATTR -fv PREFIX]\n"
    "  dynrep backup  -t TABLE -e ENV\n"
    "  dynrep restore -t TABLE -b BACKUP_TABLE -e ENV\n";

namespace {

using cli::Args;

// One session per environment, shared by every table in it.
class Sessions {
 public:
  shared_ptr<storage::ITableService> for_env(const string& env) {
    auto it = by_env_.find(env);
    if (it != by_env_.end()) return it->second;
    auto service = storage::CreateTableServiceForEnv(env);
    by_env_[env] = service;
    return service;
  }

  replication::TableHandle open(const string& env, const string& table) {
    return replication::TableHandle(env, table, for_env(env));
  }

 private:
  map<string, shared_ptr<storage::ITableService>> by_env_;
};

replication::ItemSelector selector_from(const Args& args) {
  replication::ItemSelector sel;
  sel.partition_value = args.get("pk").value_or("");
  sel.sort_prefix = args.get("sk");
  sel.index_name = args.get("index");
  return sel;
}

int run_copy(const Args& args, replication::Replicator& replicator, Sessions& sessions) {
  const string table = *args.get("table");
  auto source = sessions.open(*args.get("source"), table);
  auto target = sessions.open(*args.get("target"), table);
  if (args.get("pk").has_value()) {
    replicator.CopyItems(source, target, selector_from(args));
  } else {
    replicator.CopyTable(source, target);
  }
  return kExitOk;
}

int run_query(const Args& args, replication::Replicator& replicator, Sessions& sessions) {
  auto table = sessions.open(*args.get("env"), *args.get("table"));
  const auto sel = selector_from(args);

  vector<storage::Item> items;
  if (args.get("filter").has_value()) {
    replication::AttributeFilter filter;
    filter.attribute = *args.get("filter");
    filter.prefix = args.get("filter_value").value_or("");
    items = replicator.QueryWithFilter(table, sel, filter);
  } else {
    items = replicator.Query(table, sel);
  }

  if (items.empty()) {
    cout << "No item was found.\n";
    return kExitOk;
  }
  cout << items.size() << " items queried.\n";
  if (args.head) {
    cout << protocol::encode_item_json(items.front()) << "\n";
    cout << string(30, '-') << "\n";
  }
  if (args.get("unique").has_value()) {
    cout << protocol::encode_string_set_json(protocol::unique_string_values(items, *args.get("unique"))) << "\n";
  }
  return kExitOk;
}

int run_backup(const Args& args, replication::Replicator& replicator, Sessions& sessions) {
  auto table = sessions.open(*args.get("env"), *args.get("table"));
  const auto info = replicator.CreateBackup(table);
  cout << "Backup " << info.name << " (" << info.status << "): " << info.arn << "\n";
  return kExitOk;
}

int run_restore(const Args& args, replication::Replicator& replicator, Sessions& sessions) {
  const string env = *args.get("env");
  auto table = sessions.open(env, *args.get("table"));
  auto backup = sessions.open(env, *args.get("backup"));
  replicator.RestoreFromBackup(table, backup);
  return kExitOk;
}

int run(const Args& args, const ReplicaConfig& cfg) {
  string error;
  if (!cli::ValidateArgs(args, error)) {
    cerr << "dynrep: " << error << "\n" << kUsage;
    return kExitUsage;
  }

  replication::ReplicatorOptions options;
  options.scan_segments = cfg.segments;
  options.query_page_size = cfg.query_page_size;
  options.backoff.initial_delay = cfg.BackoffInitialDelay();
  options.backoff.max_attempts = cfg.backoff_max_attempts;

  replication::WorkerPool pool(static_cast<size_t>(cfg.workers));
  replication::Replicator replicator(pool, options);
  Sessions sessions;

  try {
    if (args.command == "copy") return run_copy(args, replicator, sessions);
    if (args.command == "query") return run_query(args, replicator, sessions);
    if (args.command == "backup") return run_backup(args, replicator, sessions);
    return run_restore(args, replicator, sessions);
  } catch (const storage::ConfigurationError& e) {
    util::LogError(string("Configuration error: ") + e.what());
  } catch (const storage::RetryExhaustedError& e) {
    util::LogError(string("Gave up after ") + to_string(e.attempts()) + " retries: " + e.what());
  } catch (const storage::ServiceError& e) {
    util::LogError(string("DynamoDB error (HTTP ") + to_string(e.http_status()) + "): " + e.what());
  } catch (const exception& e) {
    util::LogError(string("Error: ") + e.what());
  }
  return kExitError;
}

}  // namespace

int main(int argc, char** argv) {
  string error;
  const auto args = cli::ParseArgs(argc, argv, error);
  if (!args.has_value()) {
    cerr << "dynrep: " << error << "\n" << kUsage;
    return kExitUsage;
  }

  const ReplicaConfig cfg = ReplicaConfig::FromEnv();
  util::SetLogLevel(cfg.log_level);
  util::LogDebug("ReplicaConfig: DYNREP_WORKERS=" + to_string(cfg.workers) +
                 ", DYNREP_SEGMENTS=" + to_string(cfg.segments) +
                 ", DYNREP_BACKOFF_INITIAL_MS=" + to_string(cfg.backoff_initial_ms) +
                 ", DYNREP_BACKOFF_MAX_ATTEMPTS=" + to_string(cfg.backoff_max_attempts) +
                 ", DYNREP_QUERY_PAGE_SIZE=" + to_string(cfg.query_page_size));

  Aws::SDKOptions aws_options;
  Aws::InitAPI(aws_options);
  const int rc = run(*args, cfg);
  Aws::ShutdownAPI(aws_options);
  return rc;
}
