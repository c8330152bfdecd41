#include "config.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        Logger::error() << "Failed to open config file: " << filepath;
        return false;
    }

    bool ok = parse(file);
    Logger::debug() << "Loaded config file: " << filepath;
    return ok;
}

bool Config::loadFromString(const std::string& text) {
    std::istringstream in(text);
    return parse(in);
}

bool Config::parse(std::istream& in) {
    std::string currentSection;
    std::string line;
    int lineNumber = 0;
    bool clean = true;

    while (std::getline(in, line)) {
        ++lineNumber;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line[line.length() - 1] == ']') {
            currentSection = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos) {
            Logger::warning() << "Ignoring malformed config line " << lineNumber << ": " << line;
            clean = false;
            continue;
        }

        std::string key = trim(line.substr(0, equalPos));
        std::string value = trim(line.substr(equalPos + 1));

        // Remove inline comments
        size_t commentPos = value.find_first_of("#;");
        if (commentPos != std::string::npos) {
            value = trim(value.substr(0, commentPos));
        }

        if (currentSection.empty() || key.empty()) {
            Logger::warning() << "Ignoring config key outside a section on line " << lineNumber;
            clean = false;
            continue;
        }

        m_data[currentSection][key] = value;
    }

    return clean;
}

const std::string* Config::find(const std::string& section, const std::string& key) const {
    auto sectionIt = m_data.find(section);
    if (sectionIt == m_data.end()) {
        return nullptr;
    }
    auto keyIt = sectionIt->second.find(key);
    if (keyIt == sectionIt->second.end()) {
        return nullptr;
    }
    return &keyIt->second;
}

bool Config::has(const std::string& section, const std::string& key) const {
    return find(section, key) != nullptr;
}

void Config::clear() {
    m_data.clear();
}

int Config::getInt(const std::string& section, const std::string& key, int defaultValue) const {
    if (const std::string* value = find(section, key)) {
        try {
            return std::stoi(*value);
        } catch (const std::exception&) {
            Logger::warning() << "Failed to parse int for [" << section << "]:" << key;
        }
    }
    return defaultValue;
}

float Config::getFloat(const std::string& section, const std::string& key, float defaultValue) const {
    if (const std::string* value = find(section, key)) {
        try {
            return std::stof(*value);
        } catch (const std::exception&) {
            Logger::warning() << "Failed to parse float for [" << section << "]:" << key;
        }
    }
    return defaultValue;
}

double Config::getDouble(const std::string& section, const std::string& key, double defaultValue) const {
    if (const std::string* value = find(section, key)) {
        try {
            return std::stod(*value);
        } catch (const std::exception&) {
            Logger::warning() << "Failed to parse double for [" << section << "]:" << key;
        }
    }
    return defaultValue;
}

bool Config::getBool(const std::string& section, const std::string& key, bool defaultValue) const {
    const std::string* value = find(section, key);
    if (!value) {
        return defaultValue;
    }

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") return false;

    Logger::warning() << "Failed to parse bool for [" << section << "]:" << key;
    return defaultValue;
}

std::string Config::getString(const std::string& section, const std::string& key, const std::string& defaultValue) const {
    if (const std::string* value = find(section, key)) {
        return *value;
    }
    return defaultValue;
}

std::string Config::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool Config::saveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        Logger::error() << "Failed to open config file for writing: " << filepath;
        return false;
    }

    for (const auto& section : m_data) {
        file << "[" << section.first << "]\n";
        for (const auto& keyValue : section.second) {
            file << keyValue.first << " = " << keyValue.second << "\n";
        }
        file << "\n";
    }

    return true;
}

void Config::setInt(const std::string& section, const std::string& key, int value) {
    m_data[section][key] = std::to_string(value);
}

void Config::setFloat(const std::string& section, const std::string& key, float value) {
    m_data[section][key] = std::to_string(value);
}

void Config::setBool(const std::string& section, const std::string& key, bool value) {
    m_data[section][key] = value ? "true" : "false";
}

void Config::setString(const std::string& section, const std::string& key, const std::string& value) {
    m_data[section][key] = value;
}
