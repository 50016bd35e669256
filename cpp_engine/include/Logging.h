#pragma once

#include <cstdint>
#include <string>

namespace rh {

// Process-wide spdlog setup: coloured stderr plus rotating files split by severity
// under <log_dir>/<component>/ (debug.log: everything, info.log: info and up,
// errors.log: warnings and up).
struct LoggingConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(LoggingConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    std::string component = "sender";
    std::string log_dir = "logs";
    // trace, debug, info, warn, error, critical, off
    std::string console_level = "info";
    std::uint32_t file_sinks_u32 = 1;
    std::uint32_t max_file_bytes_u32 = 5u * 1024u * 1024u;
    std::uint32_t max_files_u32 = 3;
};

std::uint32_t computeLoggingConfigHash(const LoggingConfigV1& c);

// Installs the default logger. On failure (bad level, unwritable directory) the
// default stderr logger stays in place and err describes why.
bool setupLogging(const LoggingConfigV1& cfg, std::string* err);

// Flushes and drops every registered logger.
void shutdownLogging();

} // namespace rh
