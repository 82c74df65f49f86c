#include "Logger.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace Forge {

namespace {
std::atomic<int> gMinLevel{static_cast<int>(LogLevel::Info)};
std::mutex gWriteMutex;

std::string_view toLabel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
        default:
            return "ERROR";
    }
}
}  // namespace

void Logger::log(LogLevel level, std::string_view message) {
    using namespace std::chrono;

    if (static_cast<int>(level) < gMinLevel.load(std::memory_order_relaxed)) return;

    const auto now = system_clock::now();
    const auto t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream oss;
    oss << '[' << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << "] [" << toLabel(level) << "] " << message << '\n';

    std::lock_guard<std::mutex> lock(gWriteMutex);
    std::cout << oss.str();
}

void Logger::setMinLevel(LogLevel level) {
    gMinLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel parseLogLevel(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

}  // namespace Forge
