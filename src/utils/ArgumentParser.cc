#include "oddity/utils/ArgumentParser.hh"

#include <algorithm>
#include <sstream>

namespace oddity {

void ArgumentParser::addArgument(const std::string &name,
                                 const std::string &description,
                                 bool takesValue) {
  options_.push_back(Option{name, description, takesValue});
}

const ArgumentParser::Option *
ArgumentParser::find(const std::string &name) const {
  auto it = std::find_if(options_.begin(), options_.end(),
                         [&](const Option &opt) { return opt.name == name; });
  return it == options_.end() ? nullptr : &*it;
}

Result<void> ArgumentParser::parse(int argc, const char *const *argv) {
  values_.clear();
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    const Option *opt = find(arg);
    if (!opt) {
      return Result<void>::error(ErrorCode::InvalidArgument,
                                 "Unknown option: " + arg);
    }
    if (!opt->takesValue) {
      values_[arg] = "";
      continue;
    }
    if (i + 1 >= argc) {
      return Result<void>::error(ErrorCode::InvalidArgument,
                                 "Missing value for " + arg);
    }
    values_[arg] = argv[++i];
  }
  return Result<void>::ok();
}

bool ArgumentParser::hasArgument(const std::string &name) const {
  return values_.find(name) != values_.end();
}

std::optional<std::string>
ArgumentParser::getValue(const std::string &name) const {
  auto it = values_.find(name);
  if (it == values_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

std::string ArgumentParser::usage() const {
  std::ostringstream oss;
  for (const auto &opt : options_) {
    std::string label = opt.name + (opt.takesValue ? " <value>" : "");
    oss << "  " << label;
    if (label.size() < 20) {
      oss << std::string(20 - label.size(), ' ');
    } else {
      oss << ' ';
    }
    oss << opt.description << "\n";
  }
  return oss.str();
}

} // namespace oddity
