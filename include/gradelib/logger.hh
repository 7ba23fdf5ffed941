#pragma once

#include <atomic>
#include <cstdio>
#include <gradelib/concat_tostr.hh>
#include <string>
#include <utility>

/**
 * @brief Line-oriented log
 * @details Every call produces exactly one line prefixed with the local time,
 *   e.g. "[ 2024-03-01 12:00:00 ] Sandbox x created in /tmp/...". Lines from
 *   different threads are never interleaved (flockfile(3) is held while a line
 *   is written). A logger without a stream (a dummy) discards everything.
 */
class Logger {
    FILE* f_;
    std::atomic<bool> owns_stream_{false};

    void close() noexcept {
        if (owns_stream_.exchange(false)) {
            (void)fclose(f_);
        }
    }

    void write_line(const std::string& line) noexcept;

public:
    // nullptr makes a dummy logger
    explicit Logger(FILE* stream) noexcept
    : f_{stream} {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    ~Logger() { close(); }

    // Opens @p filename in append mode, on error throws and leaves the logger
    // unchanged
    void open(const std::string& filename);

    // Does not take the ownership of @p stream, nullptr makes the logger a dummy
    void use(FILE* stream) noexcept {
        close();
        f_ = stream;
    }

    [[nodiscard]] bool is_dummy() const noexcept { return f_ == nullptr; }

    template <class... Args>
    void operator()(Args&&... args) {
        if (is_dummy()) {
            return;
        }
        write_line(concat_tostr(std::forward<Args>(args)...));
    }
};

inline Logger stdlog(stderr);
inline Logger errlog(stderr);
inline Logger debuglog(nullptr); // Dummy until setup_logging() enables it
