#pragma once

extern "C" {
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
}

#include <cerrno>
#include <filesystem>
#include <system_error>

namespace perftrack::internal {

    // exclusive advisory lock held for the lifetime of the object; throws std::system_error
    class file_lock {
        int fd_{-1};
        bool owns_fd_{false};

        void acquire(const char* what) {
            while (::flock(fd_, LOCK_EX) != 0) {
                if (errno == EINTR) {
                    continue;
                }
                auto err = errno;
                if (owns_fd_) {
                    ::close(fd_);
                }
                fd_ = -1;
                throw std::system_error(err, std::generic_category(), what);
            }
        }

      public:
        // opens (creating) and locks a dedicated lockfile
        explicit file_lock(const std::filesystem::path& path) : owns_fd_{true} {
            fd_ = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
            if (fd_ < 0) {
                throw std::system_error(errno, std::generic_category(), "failed to open lockfile " + path.string());
            }
            acquire(("failed to lock " + path.string()).c_str());
        }

        // locks a descriptor owned by the caller; it stays open on unlock
        explicit file_lock(int fd) : fd_{fd} { acquire("failed to lock table"); }

        file_lock(const file_lock&) = delete;
        file_lock& operator=(const file_lock&) = delete;

        ~file_lock() {
            if (fd_ >= 0) {
                ::flock(fd_, LOCK_UN);
                if (owns_fd_) {
                    ::close(fd_);
                }
            }
        }
    };

}  // namespace perftrack::internal
