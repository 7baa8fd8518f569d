// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/core/settings.hpp>
#include <volley/core/error.hpp>
#include <volley/core/log.hpp>
#include <volley/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>

namespace volley::core {

namespace {

using nlohmann::json;

bool read_count(const json& j, const char* key, std::uint32_t& out) {
    if (!j.contains(key)) return true;
    const auto& v = j[key];
    if (!v.is_number_unsigned() || v.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
        return false;
    }
    out = v.get<std::uint32_t>();
    return true;
}

template<typename Duration>
bool read_seconds(const json& j, const char* key, Duration& out) {
    if (!j.contains(key)) return true;
    const auto& v = j[key];
    if (!v.is_number()) {
        return false;
    }
    auto d = duration_from_seconds<Duration>(v.template get<double>());
    if (!d) {
        return false;
    }
    out = *d;
    return true;
}

double to_seconds(std::chrono::milliseconds d) noexcept {
    return static_cast<double>(d.count()) / 1000.0;
}

} // namespace

std::optional<SinkMode> parse_sink_mode(std::string_view name) noexcept {
    if (name == "single_file") return SinkMode::single_file;
    if (name == "part_files") return SinkMode::part_files;
    return std::nullopt;
}

std::expected<DownloadConfig, std::error_code> parse_config(std::string_view text, DownloadConfig cfg) {
    const auto invalid = make_error_code(DownloadErrc::invalid_config);

    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(invalid);
        }

        if (!read_count(j, "concurrency", cfg.concurrency)
            || !read_count(j, "max_retries", cfg.max_retries)
            || !read_seconds(j, "base_delay", cfg.base_delay)
            || !read_seconds(j, "max_delay", cfg.max_delay)
            || !read_seconds(j, "timeout", cfg.timeout)) {
            return std::unexpected(invalid);
        }

        if (j.contains("jitter")) {
            if (!j["jitter"].is_number()) return std::unexpected(invalid);
            cfg.jitter = j["jitter"].get<double>();
        }

        if (j.contains("chunk_size")) {
            if (!j["chunk_size"].is_number_unsigned()) return std::unexpected(invalid);
            cfg.chunk_size = j["chunk_size"].get<std::uint64_t>();
        }

        if (j.contains("sink_mode")) {
            if (!j["sink_mode"].is_string()) return std::unexpected(invalid);
            auto mode = parse_sink_mode(j["sink_mode"].get<std::string>());
            if (!mode) return std::unexpected(invalid);
            cfg.sink_mode = *mode;
        }

        if (j.contains("user_agent")) {
            if (!j["user_agent"].is_string()) return std::unexpected(invalid);
            cfg.user_agent = j["user_agent"].get<std::string>();
        }

        if (j.contains("verify_tls")) {
            if (!j["verify_tls"].is_boolean()) return std::unexpected(invalid);
            cfg.verify_tls = j["verify_tls"].get<bool>();
        }

        return cfg;
    } catch (const json::exception& e) {
        VOLLEY_DEBUG("Config parse error: {}", e.what());
        return std::unexpected(invalid);
    }
}

std::expected<DownloadConfig, std::error_code> load_config(const std::filesystem::path& path, DownloadConfig base) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    std::ostringstream text;
    text << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }

    auto cfg = parse_config(text.str(), std::move(base));
    if (!cfg) {
        VOLLEY_ERROR("Invalid config file {}", path.string());
    }
    return cfg;
}

std::string to_json(const DownloadConfig& cfg) {
    json j;
    j["concurrency"] = cfg.concurrency;
    j["max_retries"] = cfg.max_retries;
    j["base_delay"] = to_seconds(cfg.base_delay);
    j["max_delay"] = to_seconds(cfg.max_delay);
    j["jitter"] = cfg.jitter;
    j["timeout"] = cfg.timeout.count();
    j["chunk_size"] = cfg.chunk_size;
    j["sink_mode"] = std::string(to_string(cfg.sink_mode));
    j["user_agent"] = cfg.user_agent;
    j["verify_tls"] = cfg.verify_tls;
    return j.dump(4);
}

std::error_code save_config(const std::filesystem::path& path, const DownloadConfig& cfg) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return make_error_code(disk::DiskErrc::access_denied);
    }

    out << to_json(cfg) << '\n';
    out.flush();
    return out ? std::error_code{} : make_error_code(disk::DiskErrc::write_error);
}

} // namespace volley::core
