#include <climits>
#include <cstring>
#include <gradelib/errmsg.hh>
#include <gradelib/file_manip.hh>
#include <gradelib/logger.hh>
#include <gradelib/macros/throw.hh>
#include <gradelib/path.hh>
#include <gradelib/temporary_directory.hh>
#include <unistd.h>

namespace {

std::string get_cwd() {
    char buff[PATH_MAX];
    if (getcwd(buff, sizeof(buff)) == nullptr) {
        THROW_ERRNO(errno, "getcwd()");
    }
    return concat_tostr(buff, '/');
}

} // namespace

TemporaryDirectory::TemporaryDirectory(const std::string& templ) {
    size_t size = templ.size();
    while (size && templ[size - 1] == '/') {
        --size;
    }
    if (size < 6 or templ.compare(size - 6, 6, "XXXXXX") != 0) {
        THROW("Template has to end with XXXXXX: ", templ);
    }

    name_.reset(new char[size + 2]);
    std::memcpy(name_.get(), templ.data(), size);
    name_.get()[size] = name_.get()[size + 1] = '\0';

    // Create directory with permissions (mode: 0700/rwx------)
    if (mkdtemp(name_.get()) == nullptr) {
        int errnum = errno;
        name_.reset();
        THROW_ERRNO(errnum, "Cannot create temporary directory");
    }

    path_ = path_absolute(name(), name_.get()[0] == '/' ? "/" : get_cwd());
    if (path_.back() != '/') {
        path_ += '/';
    }

    name_.get()[size] = '/';
}

// NOLINTNEXTLINE(performance-noexcept-move-constructor): it throws
TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& td) {
    if (exists() && remove_r(path_) == -1) {
        THROW_ERRNO(errno, "remove_r() failed");
    }

    path_ = std::move(td.path_);
    name_ = std::move(td.name_);
    return *this;
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists() && remove_r(path_) == -1) {
        // We cannot throw because throwing from the destructor is (may be) UB
        errlog("Error: remove_r(", path_, ')', errmsg());
    }
}
