#ifndef BEXT_LOGGER_HPP
#define BEXT_LOGGER_HPP

#include <atomic>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace Bext {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4,
    OFF = 5
};

enum class LogOutput {
    CONSOLE,
    FILE,
    BOTH
};

auto logLevelToString(LogLevel level) -> std::string;

class Logger {
public:
    Logger();

    explicit Logger(LogLevel level, size_t num_threads = 1);

    Logger(LogLevel level, size_t num_threads, LogOutput output, const std::string& filename = "bext.log");

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string &message);
    void debug(const std::string &message) { log(LogLevel::DEBUG, message); }
    void info(const std::string &message) { log(LogLevel::INFO, message); }
    void warn(const std::string &message) { log(LogLevel::WARN, message); }
    void error(const std::string &message) { log(LogLevel::ERROR, message); }

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const { return log_level.load(); }
    void set_output(LogOutput output, const std::string& filename = "bext.log");

    /* Block until every queued line has been written */
    void flush();

private:
    void log_worker_func();
    void write_to_log(const std::string &message);
    void init_threads();
    void cleanup_threads();

    size_t num_threads;
    std::vector<std::thread> threads;
    std::queue<std::string> log_queue;
    size_t in_flight = 0;
    std::mutex queue_mutex;
    std::mutex output_mutex;
    std::condition_variable cv;
    std::condition_variable drained_cv;
    std::atomic<bool> running;
    std::atomic<LogLevel> log_level;
    LogOutput output_target;
    std::ofstream log_file;
    std::string filename;
};

/* Process-wide logger shared by the router and the engine */
Logger &defaultLogger();

} // namespace Bext
#endif
