// COMMONIP - Configuration File Parser
// Copyright (c) 2024 COMMONIP Developers
// MIT License
//
// INI-style configuration for ledger defaults.
//
// Format:
// - Lines starting with # or ; are comments
// - key=value pairs, keys are case-insensitive
// - [section] headers prefix the keys that follow: "[license]" then
//   "royaltyinterval=60" is the same as "license.royaltyinterval=60"
// - Values may be quoted: key="value with spaces"
// - Booleans: true/false, yes/no, on/off, 1/0
// - Integers accept s/m/h/d suffixes for durations in seconds

#ifndef COMMONIP_UTIL_CONFIG_H
#define COMMONIP_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace commonip {
namespace util {

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/**
 * A single configuration entry.
 */
struct ConfigEntry {
    std::string key;       // Fully qualified, "section.key"
    std::string value;
    std::string source;    // File path or "<string>"
    int lineNumber{0};
};

/**
 * Result of parsing configuration text.
 */
struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorSource;
    int errorLine{0};
    std::vector<std::string> warnings;

    static ConfigParseResult Success() {
        ConfigParseResult r;
        r.success = true;
        return r;
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& source = "",
                                   int line = 0) {
        ConfigParseResult r;
        r.errorMessage = msg;
        r.errorSource = source;
        r.errorLine = line;
        return r;
    }
};

/**
 * Holds parsed key/value pairs. Later definitions of a key replace earlier
 * ones.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);

    /// Parse configuration text
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    bool HasKey(const std::string& key) const;

    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;

    /// Integer with optional duration suffix (s, m, h, d, w)
    std::optional<int64_t> TryGetInt(const std::string& key) const;
    int64_t GetInt(const std::string& key, int64_t defaultValue) const;

    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool defaultValue) const;

    /// Set a value programmatically
    void Set(const std::string& key, const std::string& value);

    /// All keys under a section prefix ("license" -> "license.*")
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Source location of a key, for error messages
    std::optional<ConfigEntry> GetEntry(const std::string& key) const;

    void Clear() { entries_.clear(); }
    size_t Size() const { return entries_.size(); }

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

private:
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static std::string NormalizeKey(const std::string& key);

    std::map<std::string, ConfigEntry> entries_;
};

} // namespace util
} // namespace commonip

#endif // COMMONIP_UTIL_CONFIG_H
