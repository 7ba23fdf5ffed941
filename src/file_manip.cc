#include <cerrno>
#include <dirent.h>
#include <gradelib/file_manip.hh>
#include <sys/stat.h>
#include <unistd.h>

int remove_rat(int dirfd, const char* path) noexcept {
    constexpr int open_flags = O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC;
    int fd = openat(dirfd, path, open_flags);
    if (fd == -1 and errno == EACCES) {
        // Unreadable directory of ours, e.g. after chmod 0
        struct stat64 st = {};
        if (fstatat64(dirfd, path, &st, AT_SYMLINK_NOFOLLOW) == 0 and S_ISDIR(st.st_mode) and
            fchmodat(dirfd, path, S_IRWXU, 0) == 0)
        {
            fd = openat(dirfd, path, open_flags);
        }
    }
    if (fd == -1) {
        return unlinkat(dirfd, path, 0);
    }

    // Entries cannot be unlinked without write and search permission
    if (struct stat64 st = {}; fstat64(fd, &st) == 0 and (st.st_mode & S_IRWXU) != S_IRWXU) {
        (void)fchmod(fd, st.st_mode | S_IRWXU);
    }

    DIR* dir = fdopendir(fd);
    if (dir == nullptr) {
        close(fd);
        return unlinkat(dirfd, path, AT_REMOVEDIR);
    }

    int ec = 0;
    int rc = 0;
    errno = 0;
    while (dirent* file = readdir(dir)) {
        if (file->d_name[0] == '.' and
            (file->d_name[1] == '\0' or (file->d_name[1] == '.' and file->d_name[2] == '\0')))
        {
            continue;
        }

#ifdef _DIRENT_HAVE_D_TYPE
        if (file->d_type == DT_DIR || file->d_type == DT_UNKNOWN) {
#endif
            if (remove_rat(fd, file->d_name)) {
                ec = errno;
                rc = -1;
                break;
            }
#ifdef _DIRENT_HAVE_D_TYPE
        } else if (unlinkat(fd, file->d_name, 0)) {
            ec = errno;
            rc = -1;
            break;
        }
#endif
        errno = 0;
    }
    if (rc == 0 and errno != 0) { // readdir() failed
        ec = errno;
        rc = -1;
    }

    (void)closedir(dir);

    if (rc == -1) {
        errno = ec;
        return -1;
    }

    return unlinkat(dirfd, path, AT_REMOVEDIR);
}
