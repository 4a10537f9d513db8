#include "Logging.h"

#include "core/Config.h"

#include <cstdlib>
#include <vector>
#include <chrono>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace core {

namespace {
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
constexpr const char* kLogPattern = "[%H:%M:%S.%e] [tid %t] [%^%l%$] %v";
}

spdlog::level::level_enum parse_log_level(std::string_view s, spdlog::level::level_enum fallback) {
    s = trim_view(s);
    if (s.empty()) return fallback;
    if (s == "trace") return spdlog::level::trace;
    if (s == "debug") return spdlog::level::debug;
    if (s == "info") return spdlog::level::info;
    if (s == "warn" || s == "warning") return spdlog::level::warn;
    if (s == "error" || s == "err") return spdlog::level::err;
    if (s == "critical" || s == "crit" || s == "fatal") return spdlog::level::critical;
    if (s == "off" || s == "none" || s == "quiet") return spdlog::level::off;
    return fallback;
}

LogInitConfig determine_log_config(int argc, char** argv, spdlog::level::level_enum default_level) {
    LogInitConfig cfg{};
    cfg.level = default_level;

    if (auto lvl = env_value("WAVESYS_LOG_LEVEL")) {
        cfg.level = parse_log_level(*lvl, cfg.level);
    }
    if (auto file = env_value("WAVESYS_LOG_FILE")) {
        cfg.file_path = *file;
    }

    // CLI overrides env
    if (auto lvl = flag_value(argc, argv, "--log-level")) {
        cfg.level = parse_log_level(*lvl, cfg.level);
    }
    if (auto file = flag_value(argc, argv, "--log-file")) {
        cfg.file_path = std::string(*file);
    }
    if (has_flag(argc, argv, "--no-color")) {
        cfg.use_color = false;
    }
    return cfg;
}

void init_logging(const LogInitConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    if (cfg.use_color) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    } else {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
    }

    std::string fileSinkError;
    if (!cfg.file_path.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                cfg.file_path, kMaxLogFileSize, kMaxLogFiles));
        } catch (const spdlog::spdlog_ex& ex) {
            fileSinkError = ex.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(cfg.logger_name, sinks.begin(), sinks.end());
    logger->set_level(cfg.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    spdlog::set_level(cfg.level);
    spdlog::set_pattern(kLogPattern);
    spdlog::flush_every(std::chrono::seconds(1));

    if (!fileSinkError.empty()) {
        spdlog::warn("Log file '{}' unavailable, console only: {}", cfg.file_path, fileSinkError);
    }
    spdlog::info("Logging initialized (level={}, file={})",
                 spdlog::level::to_string_view(cfg.level),
                 cfg.file_path.empty() || !fileSinkError.empty() ? "none" : cfg.file_path.c_str());
}

void shutdown_logging() {
    spdlog::shutdown();
}

} // namespace core
