/**
 * @file Log.cpp
 * @brief Default logger setup
 */

#include "structmerge/Log.hpp"
#include <spdlog/sinks/stdout_sinks.h>
#include <mutex>

namespace structmerge::log {

namespace {
    const char* DefaultLogPattern = "%Y%m%d %H:%M:%S.%f %t %L %n | %v";

    std::shared_ptr<spdlog::logger> make_default_logger() {
        auto logger = std::make_shared<spdlog::logger>(
            "structmerge", std::make_shared<spdlog::sinks::stderr_sink_mt>());
        logger->set_pattern(DefaultLogPattern);
        logger->set_level(spdlog::level::warn);
        return logger;
    }

    std::mutex logger_mutex;

    std::shared_ptr<spdlog::logger>& current_logger() {
        static std::shared_ptr<spdlog::logger> instance = make_default_logger();
        return instance;
    }
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    return current_logger();
}

void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    current_logger() = replacement ? std::move(replacement) : make_default_logger();
}

void set_level(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    current_logger()->set_level(level);
}

} // namespace structmerge::log
