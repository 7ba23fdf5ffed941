#pragma once

#include <cstddef>
#include <cstdint>
#include <gradelib/concat_tostr.hh>
#include <optional>
#include <stdexcept>
#include <string_view>

class Utf8DecodeError : public std::runtime_error {
    size_t offset_;

public:
    explicit Utf8DecodeError(size_t offset)
    : runtime_error(concat_tostr("invalid UTF-8 sequence at byte ", offset))
    , offset_(offset) {}

    [[nodiscard]] size_t offset() const noexcept { return offset_; }
};

// Returns offset of the first byte that does not form a valid UTF-8 sequence
// or std::nullopt if whole @p str is valid UTF-8
std::optional<size_t> find_invalid_utf8(std::string_view str) noexcept;
