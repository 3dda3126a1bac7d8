/// @file src/core/logging.cpp
/// @brief `rebal` logger setup.

#include "rebal/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <utility>
#include <vector>

namespace rebal::log {

namespace {

std::mutex                      g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

[[nodiscard]] std::shared_ptr<spdlog::logger>
make_logger(std::vector<spdlog::sink_ptr> sinks, spdlog::level::level_enum level) {
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

void init(spdlog::level::level_enum level, const std::optional<std::string>& file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (file) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*file, true));
    }
    auto logger = make_logger(std::move(sinks), level);

    std::lock_guard<std::mutex> lock(g_mutex);
    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(logger);
    g_logger = std::move(logger);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = make_logger({std::make_shared<spdlog::sinks::stderr_color_sink_mt>()},
                               spdlog::level::warn);
    }
    return g_logger;
}

std::optional<spdlog::level::level_enum> parse_level(const std::string& name) noexcept {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn")     return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return std::nullopt;
}

}  // namespace rebal::log
