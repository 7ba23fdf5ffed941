#include <algorithm>
#include <cctype>
#include <gradelib/config_file.hh>

using std::string;

namespace {

constexpr char dec2hex(int x) noexcept { return static_cast<char>(x < 10 ? '0' + x : 'a' + x - 10); }

constexpr int hex2dec(char c) noexcept {
    if (c >= '0' and c <= '9') {
        return c - '0';
    }
    if (c >= 'a' and c <= 'f') {
        return c - 'a' + 10;
    }
    return c - 'A' + 10;
}

} // namespace

std::optional<bool> ConfigFile::Variable::as_bool() const noexcept {
    auto lower_equal = [](std::string_view a, std::string_view b) {
        return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) == y;
        });
    };
    if (str_ == "1" or lower_equal(str_, "on") or lower_equal(str_, "true")) {
        return true;
    }
    if (str_ == "0" or lower_equal(str_, "off") or lower_equal(str_, "false")) {
        return false;
    }
    return std::nullopt;
}

void ConfigFile::load_config_from_string(string config, bool load_all) {
    for (auto& [name, var] : vars_) {
        var = Variable{};
    }

    // Checks whether c is a white-space but not a newline
    auto is_ws = [](char c) { return (c != '\n' and std::isspace(static_cast<unsigned char>(c))); };
    // Checks whether character is one of these [a-zA-Z0-9\-_.]
    auto is_name = [](char c) {
        return (std::isalnum(static_cast<unsigned char>(c)) or c == '-' or c == '_' or c == '.');
    };

    config += '\n'; // Now each line ends with a newline character
    size_t pos = 0;

    auto throw_parse_error = [&](auto&&... args) {
        auto x = pos; // Position just after the last newline before pos
        while (x > 0 and config[x - 1] != '\n') {
            --x;
        }

        auto line = 1 + std::count(config.begin(), config.begin() + x, '\n');
        size_t col = pos - x + 1; // Indexed from 1

        ParseError pe(line, col, std::forward<decltype(args)>(args)...);

        // Construct diagnostics
        auto& diags = pe.diagnostics_;
        auto append_char = [&](unsigned char c) {
            if (std::isprint(c)) {
                diags += static_cast<char>(c);
            } else {
                diags += "\\x";
                diags += dec2hex(c >> 4);
                diags += dec2hex(c & 15);
            }
        };

        for (size_t k = x; k < pos; ++k) {
            append_char(config[k]);
        }
        size_t padding = diags.size();
        for (size_t k = pos; k < config.size() and config[k] != '\n'; ++k) {
            append_char(config[k]);
        }
        diags += '\n';
        diags.append(padding, ' ');
        diags += '^';

        throw std::move(pe);
    };

    auto skip_while = [&](auto&& pred) {
        while (pos < config.size() and pred(config[pos])) {
            ++pos;
        }
    };
    auto skip_comment = [&] { skip_while([](char c) { return c != '\n'; }); };

    auto extract_value = [&](bool is_in_array) {
        string res;
        // Single-quoted string
        if (config[pos] == '\'') {
            while (config[++pos] != '\n') {
                if (config[pos] == '\'') {
                    // Safe (newline is at the end of every line)
                    if (config[pos + 1] != '\'') {
                        ++pos;
                        return res;
                    }
                    ++pos;
                }
                res += config[pos];
            }
            throw_parse_error("Missing terminating ' character");
        }

        // Double-quoted string
        if (config[pos] == '"') {
            while (config[++pos] != '\n') {
                if (config[pos] == '"') {
                    ++pos;
                    return res;
                }

                if (config[pos] != '\\') {
                    res += config[pos];
                    continue;
                }

                // Escape sequence
                switch (config[++pos]) {
                case '\'': res += '\''; continue;
                case '"': res += '"'; continue;
                case '?': res += '?'; continue;
                case '\\': res += '\\'; continue;
                case 't': res += '\t'; continue;
                case 'a': res += '\a'; continue;
                case 'b': res += '\b'; continue;
                case 'f': res += '\f'; continue;
                case 'n': res += '\n'; continue;
                case 'r': res += '\r'; continue;
                case 'v': res += '\v'; continue;
                case 'x':
                    // pos will not go out of the buffer - (guard = newline)
                    for (int i = 0; i < 2; ++i) {
                        if (!std::isxdigit(static_cast<unsigned char>(config[++pos]))) {
                            throw_parse_error("Invalid hexadecimal digit: `", config[pos], '`');
                        }
                    }
                    res += static_cast<char>((hex2dec(config[pos - 1]) << 4) + hex2dec(config[pos]));
                    continue;
                default: throw_parse_error("Unknown escape sequence: `\\", config[pos], '`');
                }
            }
            throw_parse_error("Missing terminating \" character");
        }

        // String literal
        if (config[pos] == '[' or (is_in_array and (config[pos] == ',' or config[pos] == ']'))) {
            throw_parse_error("Invalid beginning of the string literal: `", config[pos], '`');
        }

        size_t end = pos;
        while (config[end] != '\n' and config[end] != '#' and
               (not is_in_array or (config[end] != ']' and config[end] != ',')))
        {
            ++end;
        }
        // Remove white-spaces from ending
        size_t val_end = end;
        while (val_end > pos and std::isspace(static_cast<unsigned char>(config[val_end - 1]))) {
            --val_end;
        }
        res = config.substr(pos, val_end - pos);
        pos = end;
        return res;
    };

    Variable tmp; // Used for ignored variables
    while (pos < config.size()) {
        skip_while(is_ws);
        if (pos == config.size()) {
            break;
        }
        // Newline
        if (config[pos] == '\n') {
            ++pos;
            continue;
        }
        // Comment
        if (config[pos] == '#') {
            skip_comment();
            continue;
        }

        /* Variable name */
        size_t name_beg = pos;
        skip_while(is_name);
        string name = config.substr(name_beg, pos - name_beg);
        if (name.empty()) {
            throw_parse_error("Invalid or missing variable's name");
        }

        /* Assignment operator */
        skip_while(is_ws);
        if (config[pos] == '\n' or config[pos] == '#') { // Newline or comment
            throw_parse_error("Incomplete directive: `", name, '`');
        }
        if (config[pos] != '=' and config[pos] != ':') {
            throw_parse_error("Invalid assignment operator: `", config[pos], '`');
        }
        ++pos;
        skip_while(is_ws);

        /* Value */
        Variable* varp = nullptr; // vars_ is not modified while var is used
        if (load_all) {
            varp = &vars_[name];
        } else {
            auto it = vars_.find(name);
            varp = (it != vars_.end() ? &it->second : &tmp);
        }
        Variable& var = *varp;
        var = Variable{};
        var.set_ = true;

        if (config[pos] != '[') { // Normal
            if (config[pos] != '\n' and config[pos] != '#') {
                var.str_ = extract_value(false);
            }
        } else { // Array
            var.array_ = true;
            ++pos; // Skip [

            for (;;) {
                skip_while([](char c) { return std::isspace(static_cast<unsigned char>(c)); });
                if (pos == config.size()) {
                    throw_parse_error("Missing terminating ] character at the end of an array");
                }
                if (config[pos] == ']') { // End of the array
                    ++pos;
                    break;
                }
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                // Ignore extra delimiters
                if (config[pos] == ',') {
                    ++pos;
                    continue;
                }

                var.arr_.emplace_back(extract_value(true));

                skip_while(is_ws);
                if (config[pos] == ',' or config[pos] == '\n') {
                    ++pos;
                    continue;
                }
                if (config[pos] == '#') {
                    skip_comment();
                    continue;
                }
                if (config[pos] == ']') {
                    ++pos;
                    break;
                }
                throw_parse_error("Invalid sequence after the array element");
            }
        }

        /* After the value */
        skip_while(is_ws);
        if (config[pos] == '#') {
            skip_comment();
        }
        if (config[pos] != '\n') {
            throw_parse_error("Unexpected characters after the value");
        }
        ++pos;
    }
}
