#pragma once
#include <fstream>
#include <json/json.h>
#include <string>
#include "MonitorSettings.hpp"

class SettingsParser
{
private:
    std::ifstream _file;
    std::string _file_path;
    Json::Value _root;

    void openAndParseSettingsFile();

    static void readString(const Json::Value& root, const std::string& field, std::string& value);
    static void readBool(const Json::Value& root, const std::string& field, bool& value);
    static void readPositive(const Json::Value& root, const std::string& field, std::size_t& value);
    static void readSeconds(const Json::Value& root, const std::string& field, std::chrono::seconds& value);

public:
    explicit SettingsParser(const std::string& file_path);
    ~SettingsParser();
    SettingsParser(const SettingsParser&) = delete;
    SettingsParser& operator=(const SettingsParser&) = delete;

    // Missing keys keep their defaults. Throws std::invalid_argument on a bad value
    // and std::runtime_error when the file can't be read or parsed.
    MonitorSettings loadSettings();

    // Same validation applied to an already parsed document
    static MonitorSettings parseSettings(const Json::Value& root);
};
