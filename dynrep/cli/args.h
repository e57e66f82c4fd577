#pragma once

#include <map>
#include <optional>
#include <string>

namespace cli {

struct Args {
  std::string command;
  std::map<std::string, std::string> values;
  bool head = false;

  std::optional<std::string> get(const std::string& name) const;
};

// argv[1] is the command; every other flag takes one value except -head.
std::optional<Args> ParseArgs(int argc, const char* const* argv, std::string& error);

// Checks the command name and its required flags. `copy` accepts -sk and -i
// only together with -pk, since without -pk it truncates the target.
bool ValidateArgs(const Args& args, std::string& error);

}  // namespace cli
