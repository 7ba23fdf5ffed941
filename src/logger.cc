#include <array>
#include <ctime>
#include <gradelib/errmsg.hh>
#include <gradelib/logger.hh>
#include <gradelib/macros/throw.hh>

void Logger::open(const std::string& filename) {
    FILE* f = fopen(filename.c_str(), "ae");
    if (f == nullptr) {
        THROW("fopen('", filename, "') failed", errmsg());
    }
    close();
    f_ = f;
    owns_stream_ = true;
}

void Logger::write_line(const std::string& line) noexcept {
    std::array<char, 32> date{};
    time_t now = time(nullptr);
    struct tm tm {};
    if (localtime_r(&now, &tm) == nullptr or
        strftime(date.data(), date.size(), "%Y-%m-%d %H:%M:%S", &tm) == 0)
    {
        (void)snprintf(date.data(), date.size(), "unknown time");
    }

    flockfile(f_);
    (void)fprintf(f_, "[ %s ] %.*s\n", date.data(), static_cast<int>(line.size()), line.data());
    (void)fflush(f_);
    funlockfile(f_);
}
