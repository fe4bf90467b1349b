#include "formsave/io/FileReader.hpp"
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace formsave {
namespace io {

core::Result<std::unique_ptr<FileReader>> FileReader::open(const std::string& path, size_t buffer_size) {
    auto file = utils::FileWrapper::open(path, O_RDONLY | O_CLOEXEC);
    if (!file) {
        return std::move(file).error();
    }
    return std::unique_ptr<FileReader>(new FileReader(std::move(file).value(), path, buffer_size));
}

core::Result<core::ByteView> FileReader::fillBuffer() {
    if (pos_ < len_ || eof_) {
        return core::ByteView(buffer_.data() + pos_, len_ - pos_);
    }

    ssize_t n = ::read(file_.get(), buffer_.data(), buffer_.size());
    if (n < 0) {
        const int saved_errno = errno;
        return core::errorFromErrno(saved_errno, core::ErrorCode::FileReadError, "read failed", path_);
    }
    pos_ = 0;
    len_ = static_cast<size_t>(n);
    eof_ = (n == 0);
    return core::ByteView(buffer_.data(), len_);
}

void FileReader::consume(size_t amount) {
    pos_ = std::min(pos_ + amount, len_);
}

} // namespace io
} // namespace formsave
