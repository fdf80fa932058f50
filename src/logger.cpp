#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Bext {

auto logLevelToString(LogLevel level) -> std::string {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
        default: return "UNKNOWN";
    }
}

Logger::Logger() : Logger(LogLevel::INFO, 1, LogOutput::CONSOLE) {
}

Logger::Logger(LogLevel level, size_t num_threads)
    : Logger(level, num_threads, LogOutput::CONSOLE) {
}

Logger::Logger(LogLevel level, size_t num_threads, LogOutput output, const std::string& filename)
    : num_threads(num_threads == 0 ? 1 : num_threads), running(true), log_level(level),
      output_target(output), filename(filename) {

    if (output_target == LogOutput::FILE || output_target == LogOutput::BOTH) {
        log_file.open(filename, std::ios::app);
        if (!log_file.is_open()) {
            std::cerr << "[Bext] Failed to open log file: " << filename << std::endl;
        }
    }

    init_threads();
}

Logger::~Logger() {
    cleanup_threads();
    if (log_file.is_open()) {
        log_file.close();
    }
}

void Logger::init_threads() {
    for (size_t i = 0; i < num_threads; i++) {
        threads.emplace_back(&Logger::log_worker_func, this);
    }
}

void Logger::cleanup_threads() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        running = false;
    }
    cv.notify_all();
    for (auto &thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads.clear();
}

void Logger::set_log_level(LogLevel level) {
    log_level = level;
}

void Logger::set_output(LogOutput output, const std::string& new_filename) {
    std::lock_guard<std::mutex> lock(output_mutex);
    output_target = output;

    if ((output == LogOutput::FILE || output == LogOutput::BOTH) &&
        (new_filename != filename || !log_file.is_open())) {

        if (log_file.is_open()) {
            log_file.close();
        }

        filename = new_filename;
        log_file.open(filename, std::ios::app);
        if (!log_file.is_open()) {
            std::cerr << "[Bext] Failed to open log file: " << filename << std::endl;
        }
    }
}

void Logger::log(LogLevel level, const std::string &message) {
    if (level < log_level.load() || level == LogLevel::OFF) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::stringstream ss;
    ss << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    ss << "[" << logLevelToString(level) << "] [Bext] " << message;

    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        log_queue.push(ss.str());
    }
    cv.notify_one();
}

void Logger::flush() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    drained_cv.wait(lock, [this] { return log_queue.empty() && in_flight == 0; });
}

void Logger::log_worker_func() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    while (true) {
        cv.wait(lock, [this] { return !log_queue.empty() || !running; });

        while (!log_queue.empty()) {
            std::string message = std::move(log_queue.front());
            log_queue.pop();
            ++in_flight;
            lock.unlock();

            write_to_log(message);

            lock.lock();
            --in_flight;
        }
        drained_cv.notify_all();

        if (!running) {
            break;
        }
    }
}

void Logger::write_to_log(const std::string &message) {
    std::lock_guard<std::mutex> lock(output_mutex);
    switch (output_target) {
        case LogOutput::CONSOLE:
            std::cout << message << std::endl;
            break;

        case LogOutput::FILE:
            if (log_file.is_open()) {
                log_file << message << std::endl;
            }
            break;

        case LogOutput::BOTH:
            std::cout << message << std::endl;
            if (log_file.is_open()) {
                log_file << message << std::endl;
            }
            break;
    }
}

Logger &defaultLogger() {
    static Logger logger(LogLevel::INFO, 1, LogOutput::CONSOLE);
    return logger;
}

} // namespace Bext
