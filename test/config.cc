#include "gradelib/config.hh"

#include <gradelib/concat_tostr.hh>
#include <gradelib/config_file.hh>
#include <gradelib/file_contents.hh>
#include <gradelib/logger.hh>
#include <gradelib/temporary_directory.hh>
#include <gtest/gtest.h>

using gradelib::Config;

// NOLINTNEXTLINE
TEST(config, defaults) {
    Config config;
    EXPECT_EQ(config.temp_dir, "/tmp");
    EXPECT_EQ(config.log_file, "");
    EXPECT_FALSE(config.file_log_debug);
    EXPECT_FALSE(config.stream_log_detailed);
    EXPECT_TRUE(config.keep_sandbox);
    EXPECT_TRUE(config.use_cgroups);
    EXPECT_EQ(config.sandbox_implementation, "rlimit");
    EXPECT_EQ(config.max_file_size, 1048576);
    EXPECT_EQ(config.compilation_sandbox_max_processes, 1000);
    EXPECT_EQ(config.compilation_sandbox_max_time_s, 10);
    EXPECT_EQ(config.compilation_sandbox_max_memory_kib, 524288);
    EXPECT_EQ(config.trusted_sandbox_max_processes, 1000);
    EXPECT_EQ(config.trusted_sandbox_max_time_s, 10);
    EXPECT_EQ(config.trusted_sandbox_max_memory_kib, 4194304);

    auto parsed = Config::from_string("");
    EXPECT_EQ(parsed.temp_dir, config.temp_dir);
    EXPECT_EQ(parsed.max_file_size, config.max_file_size);
    EXPECT_EQ(parsed.keep_sandbox, config.keep_sandbox);
}

// NOLINTNEXTLINE
TEST(config, overrides) {
    auto config = Config::from_string(R"(
temp_dir: /var/tmp/gradelib
keep_sandbox: false
file_log_debug: on
max_file_size: 2048
compilation_sandbox_max_time_s: 2.5
trusted_sandbox_max_processes: 4
unknown_option: whatever
)");
    EXPECT_EQ(config.temp_dir, "/var/tmp/gradelib");
    EXPECT_FALSE(config.keep_sandbox);
    EXPECT_TRUE(config.file_log_debug);
    EXPECT_EQ(config.max_file_size, 2048);
    EXPECT_DOUBLE_EQ(config.compilation_sandbox_max_time_s, 2.5);
    EXPECT_EQ(config.trusted_sandbox_max_processes, 4);
    // Untouched ones keep their defaults
    EXPECT_TRUE(config.use_cgroups);
    EXPECT_EQ(config.trusted_sandbox_max_memory_kib, 4194304);
}

// NOLINTNEXTLINE
TEST(config, invalid_values) {
    EXPECT_THROW(Config::from_string("max_file_size: lots\n"), std::runtime_error);
    EXPECT_THROW(Config::from_string("max_file_size: -1\n"), std::runtime_error);
    EXPECT_THROW(Config::from_string("trusted_sandbox_max_time_s: -2\n"), std::runtime_error);
    EXPECT_THROW(Config::from_string("keep_sandbox: maybe\n"), std::runtime_error);
    EXPECT_THROW(Config::from_string("temp_dir: [a, b]\n"), std::runtime_error);
    EXPECT_THROW(Config::from_string("temp_dir: ''\n"), std::runtime_error);
    EXPECT_THROW(Config::from_string("keep_sandbox false\n"), ConfigFile::ParseError);
}

// NOLINTNEXTLINE
TEST(config, limits_that_would_overflow) {
    // 2^54 KiB == 2^64 bytes
    EXPECT_THROW(Config::from_string("max_file_size: 18014398509481984\n"), std::runtime_error);
    EXPECT_THROW(
        Config::from_string("trusted_sandbox_max_memory_kib: 18446744073709551615\n"),
        std::runtime_error
    );
    EXPECT_THROW(
        Config::from_string("compilation_sandbox_max_memory_kib: 18014398509481984\n"),
        std::runtime_error
    );
    EXPECT_THROW(Config::from_string("trusted_sandbox_max_time_s: 1e300\n"), std::runtime_error);
    EXPECT_THROW(Config::from_string("compilation_sandbox_max_time_s: inf\n"), std::runtime_error);
    EXPECT_THROW(Config::from_string("compilation_sandbox_max_time_s: nan\n"), std::runtime_error);

    auto config = Config::from_string(
        "max_file_size: 18014398509481983\ntrusted_sandbox_max_time_s: 1000000000\n"
    );
    EXPECT_EQ(config.max_file_size, 18014398509481983ULL);
    EXPECT_DOUBLE_EQ(config.trusted_sandbox_max_time_s, 1e9);
}

// NOLINTNEXTLINE
TEST(config, from_config_file) {
    TemporaryDirectory tmp_dir("/tmp/gradelib-test.XXXXXX");
    auto path = tmp_dir.path() + "gradelib.conf";
    put_file_contents(path, "sandbox_implementation: rlimit\nuse_cgroups: 0\n");
    auto config = Config::from_config_file(path);
    EXPECT_EQ(config.sandbox_implementation, "rlimit");
    EXPECT_FALSE(config.use_cgroups);

    EXPECT_THROW(Config::from_config_file(tmp_dir.path() + "missing.conf"), std::system_error);
}

// NOLINTNEXTLINE
TEST(config, setup_logging) {
    Config config;
    gradelib::setup_logging(config);
    EXPECT_TRUE(debuglog.is_dummy());

    config.stream_log_detailed = true;
    gradelib::setup_logging(config);
    EXPECT_FALSE(debuglog.is_dummy());

    config.stream_log_detailed = false;
    gradelib::setup_logging(config);
    EXPECT_TRUE(debuglog.is_dummy());
}

// NOLINTNEXTLINE
TEST(config, log_file) {
    TemporaryDirectory tmp_dir("/tmp/gradelib-test.XXXXXX");
    auto config = Config::from_string(
        concat_tostr("log_file: '", tmp_dir.path(), "gradelib.log'\nfile_log_debug: true\n")
    );
    EXPECT_EQ(config.log_file, tmp_dir.path() + "gradelib.log");

    gradelib::setup_logging(config);
    stdlog("standard line");
    errlog("error line");
    debuglog("debug line");
    gradelib::setup_logging(Config{});
    EXPECT_TRUE(debuglog.is_dummy());

    auto log = get_file_contents(config.log_file);
    EXPECT_NE(log.find("] standard line\n"), std::string::npos) << log;
    EXPECT_NE(log.find("] error line\n"), std::string::npos) << log;
    EXPECT_NE(log.find("] debug line\n"), std::string::npos) << log;
    EXPECT_EQ(log.front(), '[');
}
