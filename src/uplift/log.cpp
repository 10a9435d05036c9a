// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <vector>

namespace uplift::log {

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_default() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    logger->set_level(spdlog::level::warn);
    return logger;
}

} // namespace

std::error_code init(const LogOptions& options) noexcept {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (options.console) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        if (!options.file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                options.file, options.max_file_size, options.max_files));
        }

        auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        logger->set_level(options.level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);

        std::lock_guard lock(g_logger_mutex);
        g_logger = std::move(logger);
        return {};
    } catch (const spdlog::spdlog_ex&) {
        return std::make_error_code(std::errc::io_error);
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }
}

std::shared_ptr<spdlog::logger> get() noexcept {
    std::lock_guard lock(g_logger_mutex);
    if (!g_logger) {
        try {
            g_logger = make_default();
        } catch (const std::exception&) {
            // Sinks failed to allocate; fall back to spdlog's own default
            return spdlog::default_logger();
        }
    }
    return g_logger;
}

} // namespace uplift::log
