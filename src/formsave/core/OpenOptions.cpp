#include "formsave/core/OpenOptions.hpp"
#include <fcntl.h>

namespace formsave {
namespace core {

Result<int> OpenOptions::toNativeFlags() const {
    int access = 0;
    if (read_ && (write_ || append_)) {
        access = O_RDWR;
    } else if (write_ || append_) {
        access = O_WRONLY;
    } else if (read_) {
        access = O_RDONLY;
    } else {
        return makeError(ErrorCode::InvalidArgument, "open options grant neither read nor write access");
    }

    const bool writable = write_ || append_;
    if (!writable && (truncate_ || create_ || create_new_)) {
        return makeError(ErrorCode::InvalidArgument, "create/truncate requires write access");
    }
    if (append_ && truncate_ && !create_new_) {
        return makeError(ErrorCode::InvalidArgument, "append and truncate are mutually exclusive");
    }

    int creation = 0;
    if (create_new_) {
        creation = O_CREAT | O_EXCL;
    } else {
        if (create_) creation |= O_CREAT;
        if (truncate_) creation |= O_TRUNC;
    }

    int flags = access | creation | O_CLOEXEC;
    if (append_) {
        flags |= O_APPEND;
    }
    return flags;
}

} // namespace core
} // namespace formsave
