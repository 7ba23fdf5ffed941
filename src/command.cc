#include <gradelib/command.hh>
#include <string_view>

namespace {

bool needs_quoting(std::string_view arg) noexcept {
    if (arg.empty()) {
        return true;
    }
    for (char c : arg) {
        bool safe = (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
            std::string_view{"@%+=:,./_-"}.find(c) != std::string_view::npos;
        if (not safe) {
            return true;
        }
    }
    return false;
}

} // namespace

namespace gradelib {

std::string to_shell_str(const Command& command) {
    std::string res;
    for (const auto& arg : command) {
        if (not res.empty()) {
            res += ' ';
        }
        if (not needs_quoting(arg)) {
            res += arg;
            continue;
        }
        res += '\'';
        for (char c : arg) {
            if (c == '\'') {
                res += "'\"'\"'";
            } else {
                res += c;
            }
        }
        res += '\'';
    }
    return res;
}

} // namespace gradelib
