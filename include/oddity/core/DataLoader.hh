#pragma once

#include "oddity/utils/ErrorHandling.hh"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <toml++/toml.hpp>

namespace oddity {

/**
 * @brief Read-only view of a parsed TOML document
 *
 * Values are addressed with dotted keys ("time.rewind_speed"). Getters return
 * NotFound for a missing key and TypeMismatch for a type mismatch. Parse
 * errors come back as ParseError with "source:line:column - description".
 */
class DataLoader {
  public:
    static Result<DataLoader> load(const std::filesystem::path& path);
    static Result<DataLoader> parse(std::string_view tomlContent, std::string_view sourceName = "<string>");

    Result<std::string> getString(std::string_view key) const;
    Result<int64_t> getInt(std::string_view key) const;
    // Integers are accepted and widened.
    Result<double> getFloat(std::string_view key) const;
    Result<bool> getBool(std::string_view key) const;

    bool hasKey(std::string_view key) const;

    const toml::table& table() const;
    const std::string& sourceName() const;

  private:
    DataLoader(toml::table tbl, std::string source);

    const toml::node* resolve(std::string_view dottedKey) const;
    template <typename T> Result<T> lookup(std::string_view key, std::string_view typeName) const;
    std::string formatError(std::string_view key, std::string_view expected) const;

    toml::table table_;
    std::string sourceName_;
};

} // namespace oddity
