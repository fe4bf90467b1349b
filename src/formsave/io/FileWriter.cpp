#include "formsave/io/FileWriter.hpp"
#include <cerrno>
#include <unistd.h>

namespace formsave {
namespace io {

core::Result<FileWriter> FileWriter::open(const std::string& path, const core::OpenOptions& options) {
    auto flags = options.toNativeFlags();
    if (!flags) {
        core::Error err = std::move(flags).error();
        err.context = path;
        return err;
    }

    auto file = utils::FileWrapper::open(path, *flags, options.getMode());
    if (!file) {
        return std::move(file).error();
    }
    return FileWriter(std::move(file).value(), path);
}

core::Result<size_t> FileWriter::write(const uint8_t* data, size_t size) {
    if (!file_) {
        return core::makeError(core::ErrorCode::InvalidState, "write to closed file", path_);
    }
    ssize_t written = ::write(file_.get(), data, size);
    if (written < 0) {
        const int saved_errno = errno;
        return core::errorFromErrno(saved_errno, core::ErrorCode::FileWriteError, "write failed", path_);
    }
    return static_cast<size_t>(written);
}

} // namespace io
} // namespace formsave
