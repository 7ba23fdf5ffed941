#include <cmath>
#include <cstdint>
#include <gradelib/config.hh>
#include <gradelib/config_file.hh>
#include <gradelib/file_contents.hh>
#include <gradelib/logger.hh>
#include <gradelib/macros/throw.hh>
#include <limits>
#include <string_view>

namespace {

void load_bool(const ConfigFile& cf, std::string_view name, bool& dest) {
    const auto& var = cf[name];
    if (not var.is_set()) {
        return;
    }
    auto val = var.as_bool();
    if (var.is_array() or not val) {
        THROW("config: variable ", name, " has to be a boolean, got: ", var.as_string());
    }
    dest = *val;
}

template <class T>
void load_number(const ConfigFile& cf, std::string_view name, T& dest) {
    const auto& var = cf[name];
    if (not var.is_set()) {
        return;
    }
    auto val = var.as<T>();
    if (var.is_array() or not val or *val < T{}) {
        THROW("config: variable ", name, " has to be a non-negative number, got: ", var.as_string());
    }
    dest = *val;
}

void load_string(const ConfigFile& cf, std::string_view name, std::string& dest) {
    const auto& var = cf[name];
    if (not var.is_set()) {
        return;
    }
    if (var.is_array()) {
        THROW("config: variable ", name, " has to be a string, not an array");
    }
    dest = var.as_string();
}

// Sizes are converted to bytes
void check_kib(std::string_view name, uint64_t value) {
    if (value > std::numeric_limits<uint64_t>::max() / 1024) {
        THROW("config: variable ", name, " is too large: ", value, " KiB");
    }
}

// Time limits are converted to nanoseconds (the wall time limit is twice as
// long)
void check_seconds(std::string_view name, double value) {
    constexpr double MAX_SECONDS = 1e9;
    if (not std::isfinite(value) or value > MAX_SECONDS) {
        THROW("config: variable ", name, " has to be at most ", MAX_SECONDS, " seconds");
    }
}

} // namespace

namespace gradelib {

Config Config::from_config_file(const std::string& path) {
    return from_string(get_file_contents(path));
}

Config Config::from_string(std::string str) {
    ConfigFile cf;
    cf.add_vars(
        "temp_dir",
        "log_file",
        "file_log_debug",
        "stream_log_detailed",
        "keep_sandbox",
        "use_cgroups",
        "sandbox_implementation",
        "max_file_size",
        "compilation_sandbox_max_processes",
        "compilation_sandbox_max_time_s",
        "compilation_sandbox_max_memory_kib",
        "trusted_sandbox_max_processes",
        "trusted_sandbox_max_time_s",
        "trusted_sandbox_max_memory_kib"
    );
    cf.load_config_from_string(std::move(str));

    Config config;
    load_string(cf, "temp_dir", config.temp_dir);
    if (config.temp_dir.empty()) {
        THROW("config: temp_dir cannot be empty");
    }
    load_string(cf, "log_file", config.log_file);
    load_bool(cf, "file_log_debug", config.file_log_debug);
    load_bool(cf, "stream_log_detailed", config.stream_log_detailed);
    load_bool(cf, "keep_sandbox", config.keep_sandbox);
    load_bool(cf, "use_cgroups", config.use_cgroups);
    load_string(cf, "sandbox_implementation", config.sandbox_implementation);
    load_number(cf, "max_file_size", config.max_file_size);
    load_number(
        cf, "compilation_sandbox_max_processes", config.compilation_sandbox_max_processes
    );
    load_number(cf, "compilation_sandbox_max_time_s", config.compilation_sandbox_max_time_s);
    load_number(
        cf, "compilation_sandbox_max_memory_kib", config.compilation_sandbox_max_memory_kib
    );
    load_number(cf, "trusted_sandbox_max_processes", config.trusted_sandbox_max_processes);
    load_number(cf, "trusted_sandbox_max_time_s", config.trusted_sandbox_max_time_s);
    load_number(cf, "trusted_sandbox_max_memory_kib", config.trusted_sandbox_max_memory_kib);

    check_kib("max_file_size", config.max_file_size);
    check_kib("compilation_sandbox_max_memory_kib", config.compilation_sandbox_max_memory_kib);
    check_kib("trusted_sandbox_max_memory_kib", config.trusted_sandbox_max_memory_kib);
    check_seconds("compilation_sandbox_max_time_s", config.compilation_sandbox_max_time_s);
    check_seconds("trusted_sandbox_max_time_s", config.trusted_sandbox_max_time_s);
    return config;
}

void setup_logging(const Config& config) {
    if (config.log_file.empty()) {
        stdlog.use(stderr);
        errlog.use(stderr);
    } else {
        stdlog.open(config.log_file);
        errlog.open(config.log_file);
    }

    if (config.file_log_debug and not config.log_file.empty()) {
        debuglog.open(config.log_file);
    } else if (config.file_log_debug or config.stream_log_detailed) {
        debuglog.use(stderr);
    } else {
        debuglog.use(nullptr);
    }
}

} // namespace gradelib
