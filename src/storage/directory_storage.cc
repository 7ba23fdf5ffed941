#include <cerrno>
#include <cstdio>
#include <gradelib/call_in_destructor.hh>
#include <gradelib/file_contents.hh>
#include <gradelib/file_descriptor.hh>
#include <gradelib/file_info.hh>
#include <gradelib/logger.hh>
#include <gradelib/macros/throw.hh>
#include <gradelib/sha.hh>
#include <gradelib/storage/directory_storage.hh>
#include <gradelib/stream.hh>
#include <sys/stat.h>
#include <unistd.h>

namespace gradelib::storage {

DirectoryStorage::DirectoryStorage(std::string root)
: root_{std::move(root)} {
    if (root_.empty()) {
        THROW("Storage root cannot be empty");
    }
    if (root_.back() != '/') {
        root_ += '/';
    }
    if (not is_directory(root_)) {
        THROW_ERRNO(ENOTDIR, "Storage root is not a directory: ", root_);
    }
}

bool DirectoryStorage::is_valid_digest(std::string_view digest) noexcept {
    if (digest.size() != 40) {
        return false;
    }
    for (char c : digest) {
        if (not((c >= '0' and c <= '9') or (c >= 'a' and c <= 'f'))) {
            return false;
        }
    }
    return true;
}

std::string DirectoryStorage::blob_path(std::string_view digest) const {
    if (not is_valid_digest(digest)) {
        THROW("Invalid digest: ", digest);
    }
    return concat_tostr(root_, digest);
}

void DirectoryStorage::get_file_to_stream(std::string_view digest, Stream& dest) {
    auto path = blob_path(digest);
    FileDescriptor fd{path, O_RDONLY | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW_ERRNO(errno, "Cannot open blob ", digest);
    }
    FileStream src{std::move(fd), true, false};
    copy_stream(src, dest);
}

std::string
DirectoryStorage::put_file_from_stream(Stream& src, std::string_view description) {
    std::string tmp_path = concat_tostr(root_, ".tmp.XXXXXX");
    FileDescriptor fd{mkostemp(tmp_path.data(), O_CLOEXEC)};
    if (not fd.is_open()) {
        THROW_ERRNO(errno, "mkostemp()");
    }
    CallInDtor tmp_file_remover{[&tmp_path]() noexcept { (void)unlink(tmp_path.c_str()); }};

    Sha1 sha;
    char buff[65536];
    for (;;) {
        size_t len = src.read(buff, sizeof(buff));
        if (len == 0) {
            break;
        }
        sha.update(buff, len);
        if (write_all(fd, buff, len) != len) {
            THROW_ERRNO(errno, "write()");
        }
    }
    if (fd.close()) {
        THROW_ERRNO(errno, "close()");
    }

    auto digest = sha.hex_digest();
    auto path = blob_path(digest);
    if (path_exists(path)) {
        debuglog("Blob ", digest, " is already in the storage");
        return digest; // The same content is already stored
    }

    if (chmod(tmp_path.c_str(), S_0444)) {
        THROW_ERRNO(errno, "chmod()");
    }
    put_file_contents(concat_tostr(path, ".description"), description);
    if (rename(tmp_path.c_str(), path.c_str())) {
        THROW_ERRNO(errno, "rename()");
    }
    tmp_file_remover.cancel();
    debuglog("Stored blob ", digest, " (", description, ')');
    return digest;
}

bool DirectoryStorage::has_file(std::string_view digest) const {
    return path_exists(blob_path(digest));
}

std::string DirectoryStorage::describe(std::string_view digest) const {
    return get_file_contents(concat_tostr(blob_path(digest), ".description"));
}

} // namespace gradelib::storage
