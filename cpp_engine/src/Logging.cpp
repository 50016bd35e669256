#include "Logging.h"

#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "ConfigHash.h"

namespace rh {

std::uint32_t computeLoggingConfigHash(const LoggingConfigV1& c) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c.version_u32);
    h = fnv1a32_add_str(h, c.component);
    h = fnv1a32_add_str(h, c.log_dir);
    h = fnv1a32_add_str(h, c.console_level);
    h = fnv1a32_add_u32(h, c.file_sinks_u32);
    h = fnv1a32_add_u32(h, c.max_file_bytes_u32);
    h = fnv1a32_add_u32(h, c.max_files_u32);
    return h;
}

bool setupLogging(const LoggingConfigV1& cfg, std::string* err) {
    const spdlog::level::level_enum console_level = spdlog::level::from_str(cfg.console_level);
    if (console_level == spdlog::level::off && cfg.console_level != "off") {
        if (err) *err = "unknown log level '" + cfg.console_level + "'";
        return false;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(console_level);
        sinks.push_back(console);

        if (cfg.file_sinks_u32) {
            const std::filesystem::path dir = std::filesystem::path(cfg.log_dir) / cfg.component;
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec) {
                if (err) *err = "cannot create " + dir.string() + ": " + ec.message();
                return false;
            }
            const std::size_t max_bytes = cfg.max_file_bytes_u32 ? cfg.max_file_bytes_u32 : 1024u * 1024u;
            const std::size_t max_files = cfg.max_files_u32 ? cfg.max_files_u32 : 1u;

            struct FileSink {
                const char* name;
                spdlog::level::level_enum level;
            };
            const FileSink files[] = {
                {"debug.log", spdlog::level::debug},
                {"info.log", spdlog::level::info},
                {"errors.log", spdlog::level::warn},
            };
            for (const auto& f : files) {
                auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>((dir / f.name).string(), max_bytes,
                                                                                  max_files);
                sink->set_level(f.level);
                sinks.push_back(sink);
            }
        }

        auto logger = std::make_shared<spdlog::logger>(cfg.component, sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::debug);
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%n] %^%l%$ %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        if (err) *err = e.what();
        return false;
    }
    return true;
}

void shutdownLogging() {
    spdlog::default_logger()->flush();
    spdlog::shutdown();
}

} // namespace rh
