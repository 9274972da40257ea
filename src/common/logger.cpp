/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "common/logger.hpp"

#include <mutex>

namespace confflags {

namespace {
std::mutex logger_mutex;
}  // namespace

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

void Logger::init(const std::string& name, spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (logger_ == nullptr) {
        // A host application may already have registered a logger by this name
        logger_ = spdlog::get(name);
        if (logger_ == nullptr) {
            logger_ = spdlog::stdout_color_mt(name);
        }
        logger_->set_level(level);
        logger_->set_pattern(config::kLogPattern);
    }
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (logger_ == nullptr) {
        init();
    }
    return logger_;
}

void Logger::set_level(spdlog::level::level_enum level) {
    if (logger_ != nullptr) {
        logger_->set_level(level);
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (logger_ != nullptr) {
        spdlog::drop(logger_->name());
        logger_.reset();
    }
}

}  // namespace confflags
