#include "args.h"

#include <vector>

namespace cli {
namespace {

// Short and long spellings map to one canonical name.
const std::map<std::string, std::string>& flag_names() {
  static const std::map<std::string, std::string> names = {
      {"-t", "table"},   {"--table", "table"},   {"-pk", "pk"},         {"--pk", "pk"},
      {"-sk", "sk"},     {"--sk", "sk"},         {"-i", "index"},       {"--index", "index"},
      {"-src", "source"}, {"--source", "source"}, {"-tgt", "target"},   {"--target", "target"},
      {"-e", "env"},     {"--env", "env"},       {"-u", "unique"},      {"--unique", "unique"},
      {"-f", "filter"},  {"--filter", "filter"}, {"-fv", "filter_value"}, {"--filter-value", "filter_value"},
      {"-b", "backup"},  {"--backup", "backup"},
  };
  return names;
}

bool require(const Args& args, const std::vector<std::string>& names, std::string& error) {
  for (const auto& n : names) {
    if (!args.get(n).has_value()) {
      error = "missing required argument --" + n + " for " + args.command;
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<std::string> Args::get(const std::string& name) const {
  auto it = values.find(name);
  if (it == values.end()) return std::nullopt;
  return it->second;
}

std::optional<Args> ParseArgs(int argc, const char* const* argv, std::string& error) {
  if (argc < 2) {
    error = "missing command";
    return std::nullopt;
  }
  Args args;
  args.command = argv[1];
  for (int i = 2; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "-head" || flag == "--head") {
      args.head = true;
      continue;
    }
    auto it = flag_names().find(flag);
    if (it == flag_names().end()) {
      error = "unknown argument " + flag;
      return std::nullopt;
    }
    if (i + 1 >= argc) {
      error = "missing value for " + flag;
      return std::nullopt;
    }
    args.values[it->second] = argv[++i];
  }
  return args;
}

bool ValidateArgs(const Args& args, std::string& error) {
  if (args.command == "copy") {
    if (!require(args, {"table", "source", "target"}, error)) return false;
    if (!args.get("pk").has_value() && (args.get("sk").has_value() || args.get("index").has_value())) {
      error = "--sk and --index need --pk for copy";
      return false;
    }
    return true;
  }
  if (args.command == "query") return require(args, {"table", "env", "pk"}, error);
  if (args.command == "backup") return require(args, {"table", "env"}, error);
  if (args.command == "restore") return require(args, {"table", "backup", "env"}, error);
  error = "unknown command " + args.command;
  return false;
}

}  // namespace cli
