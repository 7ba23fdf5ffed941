#pragma once

#include <cstdint>
#include <string>

namespace gradelib {

// Explicit configuration value passed to everything that needs it (there is
// no process-wide configuration object)
struct Config {
    // System-wide
    std::string temp_dir = "/tmp";
    std::string log_file; // empty means stderr
    bool file_log_debug = false;
    bool stream_log_detailed = false;

    // Sandbox lifecycle
    bool keep_sandbox = true;
    bool use_cgroups = true;
    std::string sandbox_implementation = "rlimit";

    // Limits, sizes in KiB
    uint64_t max_file_size = 1024 * 1024;
    uint32_t compilation_sandbox_max_processes = 1000;
    double compilation_sandbox_max_time_s = 10;
    uint64_t compilation_sandbox_max_memory_kib = 512 * 1024;
    uint32_t trusted_sandbox_max_processes = 1000;
    double trusted_sandbox_max_time_s = 10;
    uint64_t trusted_sandbox_max_memory_kib = 4 * 1024 * 1024;

    // Variables absent from the file keep their defaults. Throws
    // ConfigFile::ParseError on syntax errors and std::runtime_error on
    // malformed values.
    static Config from_config_file(const std::string& path);

    static Config from_string(std::string str);
};

// Points stdlog and errlog to config.log_file (or stderr). debuglog goes to
// the log file if file_log_debug is set, to stderr if stream_log_detailed is
// set and nowhere otherwise.
void setup_logging(const Config& config);

} // namespace gradelib
