#include <gradelib/concat_tostr.hh>
#include <gradelib/path.hh>

std::string path_absolute(std::string_view path, std::string curr_dir) {
    if (path.empty()) {
        return curr_dir;
    }

    std::string curr_path = std::move(curr_dir);
    if (path.front() == '/' or curr_path.empty()) {
        curr_path = '/';
    }

    if (curr_path.back() != '/') {
        curr_path += '/';
    }

    auto erase_last_component = [&curr_path] {
        if (curr_path == "/") {
            return; // ".." never goes above the root
        }
        // Remove trailing '/' to help trim last component
        if (curr_path.back() == '/') {
            curr_path.pop_back();
        }

        curr_path.resize(curr_path.size() - path_filename(curr_path).size());
    };

    auto process_component = [&](std::string_view component) {
        if (component == "..") {
            erase_last_component();
            return;
        }

        // Current path is a directory
        if (curr_path.back() != '/') {
            curr_path += '/';
        }

        if (component == ".") {
            return;
        }

        curr_path += component;
    };

    for (size_t i = 0; i < path.size(); ++i) {
        if (path[i] == '/') {
            continue;
        }

        size_t next_slash_pos = std::min(path.find('/', i + 1), path.size());
        process_component(path.substr(i, next_slash_pos - i));
        i = next_slash_pos;
    }

    if (path.back() == '/' and curr_path.back() != '/') {
        curr_path += '/'; // Add trimmed trailing slash
    }

    return curr_path;
}
