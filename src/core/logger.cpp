/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace almanac::core
{

namespace
{

constexpr const char* kCoreLoggerName = "ALMANAC";
constexpr const char* kAppLoggerName  = "APP";
constexpr const char* kPattern        = "[%T.%e] [%n] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_logger(const char* name,
                                            const std::vector<spdlog::sink_ptr>& sinks,
                                            spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::drop(name);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

// ---- Static member definitions (sinkless until init) ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger = std::make_shared<spdlog::logger>(kCoreLoggerName);
std::shared_ptr<spdlog::logger> Logger::s_app_logger  = std::make_shared<spdlog::logger>(kAppLoggerName);

void Logger::init(const LoggerConfig& config)
{
    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console)
    {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern(kPattern);
        sinks.push_back(console_sink);
    }

    if (!config.log_file.empty())
    {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, config.max_file_size, config.max_files);
        file_sink->set_pattern(kPattern);
        sinks.push_back(file_sink);
    }

    s_core_logger = make_logger(kCoreLoggerName, sinks, config.level);
    s_app_logger  = make_logger(kAppLoggerName, sinks, config.level);
}

void Logger::shutdown()
{
    s_core_logger->flush();
    s_app_logger->flush();
    spdlog::drop_all();

    s_core_logger = std::make_shared<spdlog::logger>(kCoreLoggerName);
    s_app_logger  = std::make_shared<spdlog::logger>(kAppLoggerName);
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

} // namespace almanac::core
