#pragma once

#include <string>
#include <vector>

namespace gradelib {

// Program followed by its arguments, executed verbatim (no shell involved)
using Command = std::vector<std::string>;

// Returns @p command as a line that a POSIX shell would split back into the
// same arguments, e.g. {"echo", "a b"} -> "echo 'a b'"
std::string to_shell_str(const Command& command);

} // namespace gradelib
