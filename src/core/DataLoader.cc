#include "oddity/core/DataLoader.hh"

#include <sstream>

#include "oddity/core/Log.hh"

namespace oddity {

namespace {

std::string describeParseError(std::string_view source, const toml::parse_error& err) {
    std::ostringstream oss;
    oss << source << ":" << err.source().begin.line << ":" << err.source().begin.column << " - "
        << err.description();
    return oss.str();
}

} // namespace

DataLoader::DataLoader(toml::table tbl, std::string source) : table_(std::move(tbl)), sourceName_(std::move(source)) {}

Result<DataLoader> DataLoader::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Result<DataLoader>::error(ErrorCode::NotFound, "TOML file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        ODDITY_LOG_DEBUG("Loaded TOML: {}", path.string());
        return Result<DataLoader>::ok(DataLoader(std::move(tbl), path.string()));
    } catch (const toml::parse_error& err) {
        return Result<DataLoader>::error(ErrorCode::ParseError, describeParseError(path.string(), err));
    }
}

Result<DataLoader> DataLoader::parse(std::string_view tomlContent, std::string_view sourceName) {
    try {
        auto tbl = toml::parse(tomlContent, sourceName);
        return Result<DataLoader>::ok(DataLoader(std::move(tbl), std::string(sourceName)));
    } catch (const toml::parse_error& err) {
        return Result<DataLoader>::error(ErrorCode::ParseError, describeParseError(sourceName, err));
    }
}

const toml::node* DataLoader::resolve(std::string_view dottedKey) const {
    const toml::node* current = &table_;
    std::string_view remaining = dottedKey;

    while (!remaining.empty()) {
        auto dot = remaining.find('.');
        std::string_view segment = (dot == std::string_view::npos) ? remaining : remaining.substr(0, dot);

        if (!current->is_table()) {
            return nullptr;
        }
        current = current->as_table()->get(segment);
        if (!current || dot == std::string_view::npos) {
            return current;
        }
        remaining = remaining.substr(dot + 1);
    }
    return current;
}

std::string DataLoader::formatError(std::string_view key, std::string_view expected) const {
    std::ostringstream oss;
    oss << sourceName_ << ": key '" << key << "' " << expected;
    return oss.str();
}

template <typename T> Result<T> DataLoader::lookup(std::string_view key, std::string_view typeName) const {
    const auto* node = resolve(key);
    if (!node) {
        return Result<T>::error(ErrorCode::NotFound, formatError(key, "not found"));
    }
    if (auto val = node->value_exact<T>()) {
        return Result<T>::ok(std::move(*val));
    }
    return Result<T>::error(ErrorCode::TypeMismatch, formatError(key, std::string("is not ") + std::string(typeName)));
}

Result<std::string> DataLoader::getString(std::string_view key) const {
    return lookup<std::string>(key, "a string");
}

Result<int64_t> DataLoader::getInt(std::string_view key) const {
    return lookup<int64_t>(key, "an integer");
}

Result<double> DataLoader::getFloat(std::string_view key) const {
    const auto* node = resolve(key);
    if (node && node->is_integer()) {
        return Result<double>::ok(static_cast<double>(node->as_integer()->get()));
    }
    return lookup<double>(key, "a number");
}

Result<bool> DataLoader::getBool(std::string_view key) const {
    return lookup<bool>(key, "a boolean");
}

bool DataLoader::hasKey(std::string_view key) const {
    return resolve(key) != nullptr;
}

const toml::table& DataLoader::table() const {
    return table_;
}

const std::string& DataLoader::sourceName() const {
    return sourceName_;
}

} // namespace oddity
