#pragma once

#include "oddity/utils/ErrorHandling.hh"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace oddity {

// Minimal "--flag" / "--option value" command line parser.
class ArgumentParser {
public:
  void addArgument(const std::string &name, const std::string &description,
                   bool takesValue = false);

  // Fails with InvalidArgument on an unknown option or a missing value.
  Result<void> parse(int argc, const char *const *argv);

  bool hasArgument(const std::string &name) const;
  std::optional<std::string> getValue(const std::string &name) const;

  // One line per option, in declaration order.
  std::string usage() const;

private:
  struct Option {
    std::string name;
    std::string description;
    bool takesValue;
  };

  const Option *find(const std::string &name) const;

  std::vector<Option> options_;
  std::unordered_map<std::string, std::string> values_;
};

} // namespace oddity
