#pragma once

#include <string>
#include <string_view>

/**
 * @brief Returns absolute path of @p path (resolves ".", ".." and duplicated
 *   '/' lexically, symlinks are not resolved)
 * @details Relative @p path is taken relative to @p curr_dir. Components ".."
 *   never go above "/".
 *
 *   Examples:
 *     path_absolute("a/../b", "/x/") == "/x/b"
 *     path_absolute("/../etc//passwd") == "/etc/passwd"
 *     path_absolute("foo/") == "/foo/"
 */
std::string path_absolute(std::string_view path, std::string curr_dir = "/");

// Returns the filename (last non-directory component) of @p path
constexpr std::string_view path_filename(std::string_view path) noexcept {
    auto pos = path.rfind('/');
    return path.substr(pos == std::string_view::npos ? 0 : pos + 1);
}

// Returns extension (with leading dot) of the filename of @p path or empty
// string if there is none
constexpr std::string_view path_extension(std::string_view path) noexcept {
    auto filename = path_filename(path);
    auto pos = filename.rfind('.');
    if (pos == std::string_view::npos or pos == 0) {
        return {};
    }
    return filename.substr(pos);
}

// Returns the filename of @p path without its extension
constexpr std::string_view path_stem(std::string_view path) noexcept {
    auto filename = path_filename(path);
    return filename.substr(0, filename.size() - path_extension(filename).size());
}
