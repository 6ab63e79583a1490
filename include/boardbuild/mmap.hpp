#pragma once

#include <cerrno>
#include <filesystem>
#include <string_view>
#include <system_error>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace boardbuild {

/**
 * @brief Read-only memory mapped file.
 *
 * Used for the small key/value resources the pipeline reads (version info,
 * env files). Unmaps and closes on destruction.
 * Throws std::system_error on failure.
 */
class MappedFile {
public:
    explicit MappedFile(const std::filesystem::path &path) {
        fd_ = open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd_ == -1) {
            throw std::system_error(errno, std::generic_category(), "open " + path.string());
        }

        struct stat sb;
        if (fstat(fd_, &sb) == -1) {
            int err = errno;
            close(fd_);
            throw std::system_error(err, std::generic_category(), "stat " + path.string());
        }
        if (!S_ISREG(sb.st_mode)) {
            close(fd_);
            throw std::system_error(EINVAL, std::generic_category(), path.string() + " is not a regular file");
        }
        size_ = static_cast<size_t>(sb.st_size);

        if (size_ == 0) {
            return;
        }

        void *addr = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
        if (addr == MAP_FAILED) {
            int err = errno;
            close(fd_);
            throw std::system_error(err, std::generic_category(), "mmap " + path.string());
        }
        data_ = static_cast<char *>(addr);
    }

    ~MappedFile() {
        if (data_) {
            munmap(data_, size_);
        }
        if (fd_ != -1) {
            close(fd_);
        }
    }

    std::string_view content() const {
        if (!data_)
            return {};
        return {data_, size_};
    }

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

private:
    int fd_ = -1;
    char *data_ = nullptr;
    size_t size_ = 0;
};

} // namespace boardbuild
