#pragma once
#include <iosfwd>
#include <string>
#include <map>

/**
 * @brief INI-style key/value configuration ([section] key = value)
 *
 * The bench reads its settings through Config::instance(); tests build their
 * own Config so cases never share state.
 */
class Config {
public:
    Config() = default;

    static Config& instance();

    bool loadFromFile(const std::string& filepath);
    bool loadFromString(const std::string& text);
    bool saveToFile(const std::string& filepath) const;

    bool has(const std::string& section, const std::string& key) const;
    void clear();

    int getInt(const std::string& section, const std::string& key, int defaultValue = 0) const;
    float getFloat(const std::string& section, const std::string& key, float defaultValue = 0.0f) const;
    double getDouble(const std::string& section, const std::string& key, double defaultValue = 0.0) const;
    bool getBool(const std::string& section, const std::string& key, bool defaultValue = false) const;
    std::string getString(const std::string& section, const std::string& key, const std::string& defaultValue = "") const;

    void setInt(const std::string& section, const std::string& key, int value);
    void setFloat(const std::string& section, const std::string& key, float value);
    void setBool(const std::string& section, const std::string& key, bool value);
    void setString(const std::string& section, const std::string& key, const std::string& value);

private:
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    bool parse(std::istream& in);
    const std::string* find(const std::string& section, const std::string& key) const;

    std::map<std::string, std::map<std::string, std::string>> m_data;

    std::string trim(const std::string& str) const;
};
