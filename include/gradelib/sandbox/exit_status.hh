#pragma once

#include <cstdint>
#include <string_view>

namespace gradelib::sandbox {

// How a run inside the sandbox terminated. Exactly one per completed run.
enum class ExitStatus : uint8_t {
    // The process ran and exited with code 0
    OK,
    // The process was killed by a signal
    SIGNAL,
    // CPU time limit exceeded
    TIMEOUT,
    // Wall time limit exceeded
    TIMEOUT_WALL,
    // The process exited with a non-zero code
    NONZERO_RETURN,
    // The sandbox itself failed, the submission is not to blame
    SANDBOX_ERROR,
};

constexpr std::string_view to_string(ExitStatus status) noexcept {
    switch (status) {
    case ExitStatus::OK: return "ok";
    case ExitStatus::SIGNAL: return "signal";
    case ExitStatus::TIMEOUT: return "timeout";
    case ExitStatus::TIMEOUT_WALL: return "wall timeout";
    case ExitStatus::NONZERO_RETURN: return "nonzero return";
    case ExitStatus::SANDBOX_ERROR: return "sandbox error";
    }
    __builtin_unreachable();
}

// Callers have to check this before looking at the exit code or the signal
constexpr bool is_sandbox_error(ExitStatus status) noexcept {
    return status == ExitStatus::SANDBOX_ERROR;
}

constexpr bool is_timeout(ExitStatus status) noexcept {
    return status == ExitStatus::TIMEOUT or status == ExitStatus::TIMEOUT_WALL;
}

} // namespace gradelib::sandbox
