#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <cstdlib>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "log.h"

static void install_logger(const std::string& filename);
static void apply_env_level();
static std::uint32_t env_or(const char* name, std::uint32_t fallback);
static spdlog::level::level_enum parse_level_name(const std::string& level);

void init_log(const std::string& filename)
{
    install_logger(filename);

    apply_env_level();
}

void set_level(const std::string& level)
{
    spdlog::set_level(parse_level_name(level));
}

void shutdown_log()
{
    spdlog::default_logger()->flush();
    spdlog::shutdown();
}

static void install_logger(const std::string& filename)
{
    constexpr std::uint32_t kFileSize = 10 * 1024 * 1024;
    constexpr std::uint32_t kFileCount = 3;

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!filename.empty())
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            filename, env_or("kLogFileSize", kFileSize), env_or("kLogFileCount", kFileCount)));
    }
    auto logger = std::make_shared<spdlog::logger>("sctp", begin(sinks), end(sinks));
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(3));
    spdlog::set_pattern("%Y%m%d %T.%f %t %L %v %s:%#");
}

static void apply_env_level()
{
    spdlog::set_level(spdlog::level::info);
    if (getenv("TRACE") != nullptr)
    {
        spdlog::set_level(spdlog::level::trace);
    }
    else if (getenv("DEBUG") != nullptr)
    {
        spdlog::set_level(spdlog::level::debug);
    }
}

static spdlog::level::level_enum parse_level_name(const std::string& level)
{
    struct level_alias
    {
        const char* name;
        spdlog::level::level_enum value;
    };

    static constexpr level_alias kLevels[] = {
        {.name = "trace", .value = spdlog::level::trace},
        {.name = "debug", .value = spdlog::level::debug},
        {.name = "warn", .value = spdlog::level::warn},
        {.name = "warning", .value = spdlog::level::warn},
        {.name = "err", .value = spdlog::level::err},
        {.name = "error", .value = spdlog::level::err},
        {.name = "off", .value = spdlog::level::off},
    };

    for (const auto& entry : kLevels)
    {
        if (level == entry.name)
        {
            return entry.value;
        }
    }
    return spdlog::level::info;
}

static std::uint32_t env_or(const char* name, const std::uint32_t fallback)
{
    const char* value = getenv(name);
    if (value == nullptr)
    {
        return fallback;
    }
    const long parsed = strtol(value, nullptr, 10);
    return parsed > 0 ? static_cast<std::uint32_t>(parsed) : fallback;
}
