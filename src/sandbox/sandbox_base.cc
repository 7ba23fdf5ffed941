#include <array>
#include <cerrno>
#include <cstdio>
#include <gradelib/concat_tostr.hh>
#include <gradelib/errmsg.hh>
#include <gradelib/file_descriptor.hh>
#include <gradelib/file_perms.hh>
#include <gradelib/logger.hh>
#include <gradelib/macros/throw.hh>
#include <gradelib/path.hh>
#include <gradelib/sandbox/sandbox_base.hh>
#include <gradelib/truncator.hh>
#include <gradelib/utf8.hh>
#include <unistd.h>

extern char** environ; // NOLINT(readability-redundant-declaration)

namespace gradelib::sandbox {

SandboxBase::SandboxBase(
    storage::Storage& storage, std::optional<std::string> name, std::string temp_dir
)
: storage_{storage}
, name_{name ? std::move(*name) : "unnamed"}
, temp_dir_{std::move(temp_dir)} {
    set_env.emplace("HOME", "./");
}

std::string SandboxBase::get_stats() {
    std::string res = "[";
    if (auto execution_time = get_execution_time(); execution_time) {
        std::array<char, 64> buff{};
        (void)snprintf(
            buff.data(),
            buff.size(),
            "%.3f sec",
            std::chrono::duration<double>(*execution_time).count()
        );
        res += buff.data();
    } else {
        res += "(time unknown)";
    }
    res += " - ";
    if (auto memory_used = get_memory_used(); memory_used) {
        std::array<char, 64> buff{};
        (void)snprintf(
            buff.data(), buff.size(), "%.2f MB", static_cast<double>(*memory_used) / (1024 * 1024)
        );
        res += buff.data();
    } else {
        res += "(memory usage unknown)";
    }
    res += ']';
    return res;
}

std::string SandboxBase::relative_path(std::string_view path) const {
    // path_absolute() never goes above "/" so the result stays under the root
    return concat_tostr(get_root_path(), path_absolute(path));
}

FileStream SandboxBase::create_file(std::string_view path, bool executable) {
    if (executable) {
        debuglog("Creating executable file ", path, " in sandbox ", name_);
    } else {
        debuglog("Creating plain file ", path, " in sandbox ", name_);
    }

    auto real_path = relative_path(path);
    FileDescriptor fd{real_path, O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC | O_NOFOLLOW, S_0644};
    if (not fd.is_open()) {
        int errnum = errno;
        errlog(
            "Failed to create file ",
            real_path,
            " in sandbox ",
            name_,
            ". Unable to evaluate this submission. This may be due to cheating.",
            errmsg(errnum)
        );
        THROW_ERRNO(errnum, "open('", real_path, "')");
    }
    // The umask could have dropped some bits
    if (fchmod(fd, S_0644 | (executable ? S_0111 : 0))) {
        int errnum = errno;
        errlog("Failed to set permissions of ", real_path, " in sandbox ", name_, errmsg(errnum));
        THROW_ERRNO(errnum, "fchmod('", real_path, "')");
    }
    return FileStream{std::move(fd), false, true};
}

void SandboxBase::create_file_from_storage(
    std::string_view path, std::string_view digest, bool executable
) {
    auto file = create_file(path, executable);
    storage_.get_file_to_stream(digest, file);
    file.close();
}

void SandboxBase::create_file_from_string(
    std::string_view path, std::string_view content, bool executable
) {
    auto file = create_file(path, executable);
    file.write(content);
    file.close();
}

std::unique_ptr<Stream>
SandboxBase::get_file(std::string_view path, std::optional<uint64_t> trunc_len) {
    debuglog("Retrieving file ", path, " from sandbox ", name_);
    auto real_path = relative_path(path);
    FileDescriptor fd{real_path, O_RDONLY | O_CLOEXEC | O_NOFOLLOW};
    if (not fd.is_open()) {
        THROW_ERRNO(errno, "open('", real_path, "')");
    }

    FileStream file{std::move(fd), true, false};
    if (trunc_len) {
        return std::make_unique<Truncator<FileStream>>(std::move(file), *trunc_len);
    }
    return std::make_unique<FileStream>(std::move(file));
}

std::string
SandboxBase::get_file_text(std::string_view path, std::optional<uint64_t> trunc_len) {
    auto file = get_file(path, trunc_len);
    auto text = read_to_string(*file);
    if (auto pos = find_invalid_utf8(text); pos) {
        throw Utf8DecodeError(*pos);
    }
    return text;
}

std::string SandboxBase::get_file_to_string(std::string_view path, std::optional<size_t> maxlen) {
    auto file = get_file(path);
    return read_to_string(*file, maxlen);
}

std::string SandboxBase::get_file_to_storage(
    std::string_view path, std::string_view description, std::optional<uint64_t> trunc_len
) {
    auto file = get_file(path, trunc_len);
    return storage_.put_file_from_stream(*file, description);
}

struct stat64 SandboxBase::stat_file(std::string_view path) {
    auto real_path = relative_path(path);
    struct stat64 st = {};
    if (lstat64(real_path.c_str(), &st)) {
        THROW_ERRNO(errno, "lstat('", real_path, "')");
    }
    return st;
}

bool SandboxBase::file_exists(std::string_view path) {
    struct stat64 st = {};
    return lstat64(relative_path(path).c_str(), &st) == 0;
}

void SandboxBase::remove_file(std::string_view path) {
    auto real_path = relative_path(path);
    if (unlink(real_path.c_str())) {
        THROW_ERRNO(errno, "unlink('", real_path, "')");
    }
}

std::vector<std::string> SandboxBase::build_environment() const {
    std::map<std::string, std::string, std::less<>> env;
    for (char** it = environ; it != nullptr and *it != nullptr; ++it) {
        std::string_view var{*it};
        auto eq = var.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        env.emplace(var.substr(0, eq), var.substr(eq + 1));
    }

    std::vector<std::string> res;
    auto append = [&](std::string_view name, std::string_view value) {
        if (name != "HOME") {
            res.emplace_back(concat_tostr(name, '=', value));
        }
    };

    if (preserve_env) {
        for (const auto& [name, value] : env) {
            if (set_env.find(name) == set_env.end()) {
                append(name, value);
            }
        }
    } else {
        for (const auto& name : inherit_env) {
            auto it = env.find(name);
            if (it != env.end() and set_env.find(name) == set_env.end()) {
                append(name, it->second);
            }
        }
    }
    for (const auto& [name, value] : set_env) {
        append(name, value);
    }
    res.emplace_back("HOME=./");
    return res;
}

} // namespace gradelib::sandbox
