#include "logger.hpp"
#include "cfg/cfg.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/spdlog.h>

namespace fastuuid::logger {

namespace {
constexpr char SYSLOG_LOGGER_NAME[] = "fastuuid_syslog";
constexpr char CONSOLE_LOGGER_NAME[] = "fastuuid_console";
} // namespace

void init(const cfg::cfg &cfg)
{
    const auto g = cfg.section(cfg::GENERAL_SECTION);
    auto type = static_cast<types>(g->get<int>("log_type"));
    auto priority = static_cast<priorities>(g->get<int>("log_priority"));

    switch (type) {
    case console: {
        // identifiers go to stdout, so diagnostics go to stderr
        spdlog::drop(SYSLOG_LOGGER_NAME);
        auto console_logger = spdlog::get(CONSOLE_LOGGER_NAME);
        if (!console_logger)
            console_logger = spdlog::stderr_color_mt(CONSOLE_LOGGER_NAME);
        spdlog::set_default_logger(console_logger);
        break;
    }
    case syslog: {
        auto facility = static_cast<facilities>(g->get<int>("log_facility"));
        spdlog::drop(CONSOLE_LOGGER_NAME);
        spdlog::drop(SYSLOG_LOGGER_NAME);
        auto syslog_logger = spdlog::syslog_logger_mt(SYSLOG_LOGGER_NAME, "fastuuid", LOG_PID, facility);
        spdlog::set_default_logger(syslog_logger);
        break;
    }
    }

    spdlog::set_level(static_cast<spdlog::level::level_enum>(priority));
}

} // namespace fastuuid::logger
