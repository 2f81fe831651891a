// COMMONIP - Configuration File Parser Implementation
// Copyright (c) 2024 COMMONIP Developers
// MIT License

#include "commonip/util/config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace commonip {
namespace util {

// ============================================================================
// Static Helpers
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }
    char first = str.front();
    char last = str.back();
    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        return str.substr(1, str.length() - 2);
    }
    return str;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::string ConfigManager::NormalizeKey(const std::string& key) {
    std::string lower = Trim(key);
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);

    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }

    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = NormalizeKey(trimmed.substr(1, end - 1));
        return true;
    }

    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        result = ConfigParseResult::Error("Expected key=value", source, lineNum);
        return false;
    }

    std::string key = NormalizeKey(trimmed.substr(0, eqPos));
    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            result = ConfigParseResult::Error(
                "Invalid character in key: " + std::string(1, c), source, lineNum);
            return false;
        }
    }

    std::string fullKey = currentSection.empty() ? key : currentSection + "." + key;
    if (entries_.count(fullKey) != 0) {
        result.warnings.push_back(source + ":" + std::to_string(lineNum) +
                                  ": duplicate key " + fullKey);
    }

    ConfigEntry entry;
    entry.key = fullKey;
    entry.value = Unquote(Trim(trimmed.substr(eqPos + 1)));
    entry.source = source;
    entry.lineNumber = lineNum;
    entries_[fullKey] = entry;
    return true;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + filePath);
    }

    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            filePath);
    }

    std::ostringstream content;
    content << file.rdbuf();
    return ParseString(content.str(), filePath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    std::string currentSection;
    std::string line;
    int lineNum = 0;

    ConfigParseResult result = ConfigParseResult::Success();
    while (std::getline(stream, line)) {
        ++lineNum;
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }
        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }
    return result;
}

// ============================================================================
// Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return entries_.find(NormalizeKey(key)) != entries_.end();
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = entries_.find(NormalizeKey(key));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue) const {
    return TryGetString(key).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key) const {
    auto raw = TryGetString(key);
    if (!raw) {
        return std::nullopt;
    }

    try {
        size_t pos = 0;
        int64_t value = std::stoll(*raw, &pos);
        std::string suffix = Trim(raw->substr(pos));
        if (suffix.empty()) {
            return value;
        }
        if (suffix.size() != 1) {
            return std::nullopt;
        }
        switch (std::tolower(static_cast<unsigned char>(suffix[0]))) {
            case 's': return value;
            case 'm': return value * 60;
            case 'h': return value * 3600;
            case 'd': return value * 86400;
            case 'w': return value * 604800;
            default: return std::nullopt;
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue) const {
    return TryGetInt(key).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    auto raw = TryGetString(key);
    if (!raw) {
        return std::nullopt;
    }
    return ParseBool(*raw);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    return TryGetBool(key).value_or(defaultValue);
}

void ConfigManager::Set(const std::string& key, const std::string& value) {
    ConfigEntry entry;
    entry.key = NormalizeKey(key);
    entry.value = value;
    entry.source = "<programmatic>";
    entries_[entry.key] = entry;
}

std::vector<std::string> ConfigManager::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    std::string prefix = section.empty() ? "" : NormalizeKey(section) + ".";
    for (const auto& [fullKey, entry] : entries_) {
        if (fullKey.compare(0, prefix.size(), prefix) == 0) {
            keys.push_back(fullKey);
        }
    }
    return keys;
}

std::optional<ConfigEntry> ConfigManager::GetEntry(const std::string& key) const {
    auto it = entries_.find(NormalizeKey(key));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace util
} // namespace commonip
