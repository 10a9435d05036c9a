// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/settings/settings.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <type_traits>

namespace uplift::settings {

namespace {

using nlohmann::json;

[[noreturn]] void reject(ConfigErrc e, std::string_view key) {
    throw std::system_error(make_error_code(e), std::string(key));
}

const json* find(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

template<typename T>
void read_unsigned(const json& obj, const char* key, T& out) {
    static_assert(std::is_unsigned_v<T>);
    const json* v = find(obj, key);
    if (!v) return;
    if (v->is_number_integer() && !v->is_number_unsigned()) reject(ConfigErrc::invalid_value, key);
    if (!v->is_number_unsigned()) reject(ConfigErrc::invalid_type, key);

    auto value = v->get<std::uint64_t>();
    if (value > std::numeric_limits<T>::max()) reject(ConfigErrc::invalid_value, key);
    out = static_cast<T>(value);
}

void read_millis(const json& obj, const char* key, std::chrono::milliseconds& out) {
    std::uint64_t ms = static_cast<std::uint64_t>(out.count());
    read_unsigned(obj, key, ms);
    if (ms > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        reject(ConfigErrc::invalid_value, key);
    }
    out = std::chrono::milliseconds{static_cast<std::int64_t>(ms)};
}

void read_double(const json& obj, const char* key, double& out) {
    const json* v = find(obj, key);
    if (!v) return;
    if (!v->is_number()) reject(ConfigErrc::invalid_type, key);
    out = v->get<double>();
}

void read_bool(const json& obj, const char* key, bool& out) {
    const json* v = find(obj, key);
    if (!v) return;
    if (!v->is_boolean()) reject(ConfigErrc::invalid_type, key);
    out = v->get<bool>();
}

void read_string(const json& obj, const char* key, std::string& out) {
    const json* v = find(obj, key);
    if (!v) return;
    if (!v->is_string()) reject(ConfigErrc::invalid_type, key);
    out = v->get<std::string>();
}

const json* section(const json& root, const char* key) {
    const json* v = find(root, key);
    if (v && !v->is_object()) reject(ConfigErrc::invalid_type, key);
    return v;
}

void parse_queue(const json& j, core::QueueConfig& q) {
    read_unsigned(j, "max_concurrent_files", q.max_concurrent_files);
    read_unsigned(j, "max_concurrent_chunks", q.max_concurrent_chunks);
    read_unsigned(j, "retry_attempts", q.retry_attempts);
    read_millis(j, "base_retry_delay_ms", q.base_retry_delay);
    read_bool(j, "adaptive_optimization", q.adaptive_optimization);
    read_bool(j, "network_optimization", q.network_optimization);

    std::string mode;
    read_string(j, "priority_mode", mode);
    if (!mode.empty()) {
        auto parsed = core::parse_priority_mode(mode);
        if (!parsed) reject(ConfigErrc::invalid_value, "priority_mode");
        q.priority_mode = *parsed;
    }
}

void parse_engine(const json& j, core::EngineOptions& e) {
    read_unsigned(j, "min_chunk_size", e.min_chunk_size);
    read_unsigned(j, "max_chunk_size", e.max_chunk_size);
    read_unsigned(j, "default_chunk_size", e.default_chunk_size);
    read_millis(j, "max_retry_delay_ms", e.max_retry_delay);
    read_double(j, "retry_jitter", e.retry_jitter);
    read_millis(j, "chunk_timeout_ms", e.chunk_timeout);
    read_millis(j, "finalize_timeout_ms", e.finalize_timeout);
    read_millis(j, "optimization_interval_ms", e.optimization_interval);
    read_millis(j, "network_poll_interval_ms", e.network_poll_interval);
    read_unsigned(j, "outcome_window", e.outcome_window);
    read_unsigned(j, "network_sample_capacity", e.network_sample_capacity);
    read_double(j, "network_ema_weight", e.network_ema_weight);
    read_double(j, "network_change_threshold", e.network_change_threshold);
    read_unsigned(j, "concurrency_ceiling", e.concurrency_ceiling);
    read_unsigned(j, "chunk_concurrency_ceiling", e.chunk_concurrency_ceiling);

    if (const json* t = section(j, "thresholds")) {
        read_double(*t, "low_success_rate", e.thresholds.low_success_rate);
        read_double(*t, "high_success_rate", e.thresholds.high_success_rate);
        read_double(*t, "slow_speed_ratio", e.thresholds.slow_speed_ratio);
        read_double(*t, "fast_speed_ratio", e.thresholds.fast_speed_ratio);
        read_double(*t, "shrink_factor", e.thresholds.shrink_factor);
        read_double(*t, "grow_factor", e.thresholds.grow_factor);
    }
}

void parse_log(const json& j, log::LogOptions& l) {
    std::string level;
    read_string(j, "level", level);
    if (!level.empty()) {
        auto parsed = parse_log_level(level);
        if (!parsed) reject(ConfigErrc::invalid_value, "level");
        l.level = *parsed;
    }
    read_string(j, "file", l.file);
    read_unsigned(j, "max_file_size", l.max_file_size);
    read_unsigned(j, "max_files", l.max_files);
    read_bool(j, "console", l.console);
}

void parse_http(const json& j, net::HttpOptions& h) {
    read_string(j, "api_base_url", h.api_base_url);
    read_string(j, "user_agent", h.user_agent);
    read_millis(j, "connect_timeout_ms", h.connect_timeout);
    read_millis(j, "request_timeout_ms", h.request_timeout);
    read_unsigned(j, "worker_threads", h.worker_threads);
    read_bool(j, "verify_tls", h.verify_tls);

    if (h.worker_threads == 0) reject(ConfigErrc::invalid_value, "worker_threads");
}

} // namespace

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text) noexcept {
    if (text == "trace")    return spdlog::level::trace;
    if (text == "debug")    return spdlog::level::debug;
    if (text == "info")     return spdlog::level::info;
    if (text == "warn" || text == "warning") return spdlog::level::warn;
    if (text == "error")    return spdlog::level::err;
    if (text == "critical") return spdlog::level::critical;
    if (text == "off")      return spdlog::level::off;
    return std::nullopt;
}

std::expected<Settings, std::error_code>
parse_settings(std::string_view text) noexcept {
    try {
        auto root = json::parse(text);
        if (!root.is_object()) {
            return std::unexpected(make_error_code(ConfigErrc::invalid_type));
        }

        Settings s;
        if (const json* q = section(root, "queue"))  parse_queue(*q, s.queue);
        if (const json* e = section(root, "engine")) parse_engine(*e, s.engine);
        if (const json* l = section(root, "log"))    parse_log(*l, s.log);
        if (const json* h = section(root, "http"))   parse_http(*h, s.http);

        if (core::validate(s.queue) || core::validate(s.engine)) {
            return std::unexpected(make_error_code(ConfigErrc::invalid_value));
        }
        return s;
    } catch (const json::parse_error& e) {
        log::get()->error("Settings: {}", e.what());
        return std::unexpected(make_error_code(ConfigErrc::parse_error));
    } catch (const std::system_error& e) {
        log::get()->error("Settings: {}", e.what());
        return std::unexpected(e.code());
    } catch (const std::exception& e) {
        log::get()->error("Settings: {}", e.what());
        return std::unexpected(make_error_code(ConfigErrc::invalid_type));
    }
}

std::expected<Settings, std::error_code>
load_settings(std::string_view path) noexcept {
    try {
        std::error_code ec;
        const std::filesystem::path file{std::string(path)};
        if (!std::filesystem::exists(file, ec)) {
            return std::unexpected(make_error_code(ConfigErrc::file_not_found));
        }

        std::ifstream in(file, std::ios::binary);
        if (!in) {
            return std::unexpected(make_error_code(ConfigErrc::read_error));
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad()) {
            return std::unexpected(make_error_code(ConfigErrc::read_error));
        }
        return parse_settings(buffer.str());
    } catch (const std::exception& e) {
        log::get()->error("Settings: failed to read {}: {}", path, e.what());
        return std::unexpected(make_error_code(ConfigErrc::read_error));
    }
}

} // namespace uplift::settings
