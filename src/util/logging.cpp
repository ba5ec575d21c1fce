#include "logging.hpp"

#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <vector>

namespace scape {

namespace {
std::shared_ptr<spdlog::logger> g_logger;
} // namespace

void initialize_logger(std::string_view app_name, std::string_view log_file) {
    if (g_logger) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    sinks.push_back(console_sink);

    std::string file_sink_error;
    if (!log_file.empty()) {
        try {
            auto file_sink =
                std::make_shared<spdlog::sinks::basic_file_sink_mt>(std::string(log_file), false);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            file_sink_error = e.what();
        }
    }

    g_logger = std::make_shared<spdlog::logger>(std::string(app_name), sinks.begin(), sinks.end());

#ifdef NDEBUG
    g_logger->set_level(spdlog::level::info);
#else
    g_logger->set_level(spdlog::level::debug);
#endif

    g_logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(g_logger);

    if (!file_sink_error.empty()) {
        g_logger->warn("Failed to open log file '{}': {}", log_file, file_sink_error);
    }
}

auto get_logger() -> std::shared_ptr<spdlog::logger> {
    if (!g_logger) {
        initialize_logger();
    }
    return g_logger;
}

void set_log_level(spdlog::level::level_enum level) {
    if (g_logger) {
        g_logger->set_level(level);
    }
}

auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum> {
    if (name == "trace") {
        return spdlog::level::trace;
    }
    if (name == "debug") {
        return spdlog::level::debug;
    }
    if (name == "info") {
        return spdlog::level::info;
    }
    if (name == "warn") {
        return spdlog::level::warn;
    }
    if (name == "error") {
        return spdlog::level::err;
    }
    if (name == "critical") {
        return spdlog::level::critical;
    }
    return std::nullopt;
}

} // namespace scape
