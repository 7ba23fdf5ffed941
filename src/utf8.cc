#include <gradelib/utf8.hh>

std::optional<size_t> find_invalid_utf8(std::string_view str) noexcept {
    size_t i = 0;
    auto is_continuation = [&](size_t pos) {
        return pos < str.size() and (static_cast<unsigned char>(str[pos]) & 0xc0) == 0x80;
    };
    while (i < str.size()) {
        auto c = static_cast<unsigned char>(str[i]);
        size_t len = 0;
        uint32_t code_point = 0;
        if (c < 0x80) {
            ++i;
            continue;
        }
        if ((c & 0xe0) == 0xc0) {
            len = 2;
            code_point = c & 0x1f;
        } else if ((c & 0xf0) == 0xe0) {
            len = 3;
            code_point = c & 0x0f;
        } else if ((c & 0xf8) == 0xf0) {
            len = 4;
            code_point = c & 0x07;
        } else {
            return i;
        }

        for (size_t k = 1; k < len; ++k) {
            if (not is_continuation(i + k)) {
                return i;
            }
            code_point = (code_point << 6) | (static_cast<unsigned char>(str[i + k]) & 0x3f);
        }
        // Overlong encodings, surrogates and values above U+10FFFF
        static constexpr uint32_t min_code_point[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code_point < min_code_point[len] or (code_point >= 0xd800 and code_point <= 0xdfff) or
            code_point > 0x10ffff)
        {
            return i;
        }
        i += len;
    }
    return std::nullopt;
}
