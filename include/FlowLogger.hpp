#pragma once
#include <atomic>
#include <functional>
#include <mutex>
#include <string>

class FlowLogger
{
public:
    enum Level
    {
        DEBUG_LEVEL,
        INFO_LEVEL,
        WARNING_LEVEL,
        ERROR_LEVEL
    };

    using RemoteSink = std::function<void(const std::string&)>;

    static FlowLogger& getInstance();

    void debug(const std::string& msg);
    void info(const std::string& msg);
    void warning(const std::string& msg);
    void error(const std::string& msg);

    void setLevel(Level level);
    Level getLevel() const;
    bool isEnabled(Level level) const;

    // Lines at INFO and above are forwarded to the sink, e.g. the backend WebSocket
    void setRemoteSink(const RemoteSink& sink);
    void clearRemoteSink();

    static Level parseLevel(const std::string& level_name);
    static std::string levelToString(Level level);

private:
    std::atomic<Level> _level;
    RemoteSink _remote_sink;
    std::mutex _output_mutex;

    FlowLogger(const FlowLogger&) = delete;
    FlowLogger& operator=(const FlowLogger&) = delete;
    ~FlowLogger() = default;

    FlowLogger();
    void write(Level level, const std::string& msg);
    std::string getCurrentTime();
};
