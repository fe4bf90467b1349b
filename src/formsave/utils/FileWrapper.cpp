#include "formsave/utils/FileWrapper.hpp"
#include "formsave/utils/ModuleLoggers.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace formsave {
namespace utils {

core::Result<FileWrapper> FileWrapper::open(const std::string& path, int flags, mode_t mode) {
    for (;;) {
        int fd = ::open(path.c_str(), flags, mode);
        if (fd >= 0) {
            FS_DEBUG("Opened file: {} (fd {})", path, fd);
            return FileWrapper(fd);
        }
        const int saved_errno = errno;
        if (saved_errno == EINTR) {
            continue;
        }
        return core::errorFromErrno(saved_errno, core::ErrorCode::FileOpenError,
                                    "Failed to open file", path);
    }
}

FileWrapper::~FileWrapper() {
    if (fd_ >= 0 && ::close(fd_) != 0) {
        const int saved_errno = errno;
        FS_WARN("Failed to close fd {}: {}", fd_, std::strerror(saved_errno));
    }
}

FileWrapper::FileWrapper(FileWrapper&& other) noexcept : fd_(other.release()) {}

FileWrapper& FileWrapper::operator=(FileWrapper&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = other.release();
    }
    return *this;
}

core::VoidResult FileWrapper::close() {
    if (fd_ < 0) {
        return core::VoidResult();
    }
    int fd = release();
    // close 失败后描述符状态不确定，不重试
    if (::close(fd) != 0) {
        const int saved_errno = errno;
        return core::errorFromErrno(saved_errno, core::ErrorCode::FileWriteError, "Failed to close file");
    }
    return core::VoidResult();
}

} // namespace utils
} // namespace formsave
