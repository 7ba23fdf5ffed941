#pragma once

#include <charconv>
#include <cstdint>
#include <gradelib/concat_tostr.hh>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @brief Parser of simple configuration files
 * @details Format: one `name: value` or `name = value` per line. A value is
 *   a bare literal (trailing whitespace stripped), a 'single-quoted' string
 *   ('' stands for '), a "double-quoted" string with C escapes, or an array
 *   [a, 'b', "c"] that may span multiple lines. '#' starts a comment outside
 *   of quotes.
 *
 *   Example:
 *     temp_dir: /var/tmp
 *     keep_sandbox = off
 *     names: ['a b', c]
 */
class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        std::string diagnostics_;

    public:
        template <class... Args>
        ParseError(size_t line, size_t column, Args&&... msg)
        : runtime_error{
              concat_tostr("line ", line, ':', column, ": ", std::forward<Args>(msg)...)
          } {}

        // The offending line with a '^' marker below the error column
        [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }

        friend class ConfigFile;
    };

    class Variable {
        bool set_ = false;
        bool array_ = false;
        std::string str_;
        std::vector<std::string> arr_;

        friend class ConfigFile;

    public:
        // Whether the variable appeared in the loaded config
        [[nodiscard]] bool is_set() const noexcept { return set_; }

        [[nodiscard]] bool is_array() const noexcept { return array_; }

        // "1", "on", "true" and "0", "off", "false" (case-insensitive)
        [[nodiscard]] std::optional<bool> as_bool() const noexcept;

        // std::nullopt unless the whole value is a number of type T
        template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            T res{};
            const char* end = str_.data() + str_.size();
            auto [ptr, ec] = std::from_chars(str_.data(), end, res);
            if (ec != std::errc{} or ptr != end) {
                return std::nullopt;
            }
            return res;
        }

        // Empty for arrays and unset variables
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Empty unless is_array()
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept { return arr_; }
    };

private:
    std::map<std::string, Variable, std::less<>> vars_;

    static const Variable& unset_var() noexcept {
        static const Variable var;
        return var;
    }

public:
    // Registers variables to load, duplicates are ignored
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars_.try_emplace(std::forward<Args>(names)), ...);
    }

    // Unknown or unregistered names give an unset variable
    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars_.find(name);
        return it == vars_.end() ? unset_var() : it->second;
    }

    /**
     * @brief Loads variables from @p config, previously loaded values are
     *   forgotten
     *
     * @param load_all if false, variables not registered by add_vars() are
     *   skipped, otherwise every variable is loaded
     *
     * @errors Throws ParseError on malformed input
     */
    void load_config_from_string(std::string config, bool load_all = false);
};
