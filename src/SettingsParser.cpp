#include "SettingsParser.hpp"
#include <limits>
#include <stdexcept>

SettingsParser::SettingsParser(const std::string& file_path) : _file_path(file_path)
{
    _file.open(file_path);
    if (!_file.is_open()) {
        throw std::runtime_error("Failed to open file: " + _file_path);
    }
}

SettingsParser::~SettingsParser()
{
    if (_file.is_open()) {
        _file.close();
    }
}

void SettingsParser::openAndParseSettingsFile()
{
    if (!_file.is_open()) {
        throw std::runtime_error("Failed to open file: " + _file_path);
    }

    Json::CharReaderBuilder builder;
    std::string errs;

    _file.clear();  // Clear EOF state or error flags
    _file.seekg(0); // Reset the file pointer to the beginning

    _root.clear();
    if (!Json::parseFromStream(builder, _file, &_root, &errs)) {
        throw std::runtime_error("Error parsing JSON in " + _file_path + ": " + errs);
    }
}

MonitorSettings SettingsParser::loadSettings()
{
    openAndParseSettingsFile();
    return parseSettings(_root);
}

MonitorSettings SettingsParser::parseSettings(const Json::Value& root)
{
    if (!root.isObject())
    {
        throw std::invalid_argument("Settings root must be a JSON object");
    }

    MonitorSettings settings;
    readString(root, "interface", settings.interface);
    if (settings.interface.empty())
    {
        throw std::invalid_argument("Field 'interface' must not be empty");
    }
    readBool(root, "promiscuous", settings.promiscuous);
    readSeconds(root, "session_idle_timeout_sec", settings.session_idle_timeout);
    readPositive(root, "max_sessions", settings.max_sessions);
    readSeconds(root, "sweep_interval_sec", settings.sweep_interval);
    readSeconds(root, "history_interval_sec", settings.history_interval);
    readPositive(root, "history_capacity", settings.history_capacity);
    readPositive(root, "finalized_buffer_capacity", settings.finalized_buffer_capacity);
    readPositive(root, "capture_buffer_capacity", settings.capture_buffer_capacity);
    readSeconds(root, "persist_interval_sec", settings.persist_interval);
    readString(root, "backend_uri", settings.backend_uri);

    if (root.isMember("log_level"))
    {
        std::string level_name;
        readString(root, "log_level", level_name);
        settings.log_level = FlowLogger::parseLevel(level_name);
    }
    return settings;
}

void SettingsParser::readString(const Json::Value& root, const std::string& field, std::string& value)
{
    if (!root.isMember(field)) { return; }
    if (!root[field].isString())
    {
        throw std::invalid_argument("Field '" + field + "' must be a string");
    }
    value = root[field].asString();
}

void SettingsParser::readBool(const Json::Value& root, const std::string& field, bool& value)
{
    if (!root.isMember(field)) { return; }
    if (!root[field].isBool())
    {
        throw std::invalid_argument("Field '" + field + "' must be a boolean");
    }
    value = root[field].asBool();
}

void SettingsParser::readPositive(const Json::Value& root, const std::string& field, std::size_t& value)
{
    if (!root.isMember(field)) { return; }
    const Json::Value& node = root[field];
    if (!node.isIntegral() || node.isBool())
    {
        throw std::invalid_argument("Field '" + field + "' must be an integer");
    }
    if (node.isInt64() && node.asInt64() <= 0)
    {
        throw std::invalid_argument("Field '" + field + "' must be positive, got: " + std::to_string(node.asInt64()));
    }
    value = static_cast<std::size_t>(node.asUInt64());
}

void SettingsParser::readSeconds(const Json::Value& root, const std::string& field, std::chrono::seconds& value)
{
    std::size_t seconds = static_cast<std::size_t>(value.count());
    readPositive(root, field, seconds);
    if (seconds > static_cast<std::size_t>(std::numeric_limits<int32_t>::max()))
    {
        throw std::invalid_argument("Field '" + field + "' is out of range");
    }
    value = std::chrono::seconds(seconds);
}
