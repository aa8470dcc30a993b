#include "FlowLogger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

FlowLogger & FlowLogger::getInstance()
{
    static FlowLogger instance;
    return instance;
}

FlowLogger::FlowLogger() : _level(INFO_LEVEL)
{}

void FlowLogger::debug(const std::string &msg)
{
    write(DEBUG_LEVEL, msg);
}

void FlowLogger::info(const std::string &msg)
{
    write(INFO_LEVEL, msg);
}

void FlowLogger::warning(const std::string &msg)
{
    write(WARNING_LEVEL, msg);
}

void FlowLogger::error(const std::string &msg)
{
    write(ERROR_LEVEL, msg);
}

void FlowLogger::setLevel(const Level level)
{
    _level.store(level);
}

FlowLogger::Level FlowLogger::getLevel() const
{
    return _level.load();
}

bool FlowLogger::isEnabled(const Level level) const
{
    return level >= _level.load();
}

void FlowLogger::setRemoteSink(const RemoteSink &sink)
{
    std::lock_guard lock(_output_mutex);
    _remote_sink = sink;
}

void FlowLogger::clearRemoteSink()
{
    std::lock_guard lock(_output_mutex);
    _remote_sink = nullptr;
}

FlowLogger::Level FlowLogger::parseLevel(const std::string &level_name)
{
    if (level_name == "debug") return DEBUG_LEVEL;
    if (level_name == "info") return INFO_LEVEL;
    if (level_name == "warning") return WARNING_LEVEL;
    if (level_name == "error") return ERROR_LEVEL;
    throw std::invalid_argument("Unknown log level: " + level_name);
}

std::string FlowLogger::levelToString(const Level level)
{
    switch (level)
    {
        case DEBUG_LEVEL:   return "DEBUG";
        case INFO_LEVEL:    return "INFO";
        case WARNING_LEVEL: return "WARNING";
        case ERROR_LEVEL:   return "ERROR";
        default:            return "UNKNOWN";
    }
}

void FlowLogger::write(const Level level, const std::string &msg)
{
    if (!isEnabled(level)) return;

    const std::string full_msg = getCurrentTime() + " [" + levelToString(level) + "] " + msg;

    RemoteSink remote_sink;
    {
        std::lock_guard lock(_output_mutex);
        if (level >= WARNING_LEVEL)
            std::cerr << full_msg << std::endl;
        else
            std::cout << full_msg << std::endl;
        remote_sink = _remote_sink;
    }

    // the sink must not log through FlowLogger
    if (level >= INFO_LEVEL && remote_sink)
    {
        remote_sink(full_msg);
    }
}

std::string FlowLogger::getCurrentTime()
{
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    const std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm nowTm{};
    localtime_r(&nowTime, &nowTm);

    std::stringstream ss;
    ss << "[" << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count() << "]";

    return ss.str();
}
