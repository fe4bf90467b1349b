#include "formsave/core/ErrorCode.hpp"
#include <cerrno>
#include <cstring>

namespace formsave {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

std::string Error::fullMessage() const {
    std::string out = context.empty() ? message : fmt::format("{} (Context: {})", message, context);
    if (native_code) {
        out += fmt::format(" [errno {}]", *native_code);
    }
    return out;
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::OutOfMemory:
            return "Out of memory";
        case ErrorCode::InternalError:
            return "Internal error";
        case ErrorCode::InvalidState:
            return "Invalid state";

        case ErrorCode::Interrupted:
            return "Operation interrupted";
        case ErrorCode::WriteZero:
            return "Failed to write whole buffer";
        case ErrorCode::InvalidData:
            return "Stream did not contain valid UTF-8";
        case ErrorCode::SourceReadError:
            return "Field source read error";
        case ErrorCode::StreamReadError:
            return "Stream read error";
        case ErrorCode::StreamWriteError:
            return "Stream write error";

        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileExists:
            return "File already exists";
        case ErrorCode::FileAccessDenied:
            return "File access denied";
        case ErrorCode::FileOpenError:
            return "File open error";
        case ErrorCode::FileWriteError:
            return "File write error";
        case ErrorCode::FileReadError:
            return "File read error";
        case ErrorCode::DirectoryCreateError:
            return "Directory create error";
        case ErrorCode::DirectoryRemoveError:
            return "Directory remove error";
        case ErrorCode::NoSpace:
            return "No space left on device";

        default:
            return "Unknown error";
    }
}

ErrorCode errnoToCode(int err, ErrorCode fallback) noexcept {
    switch (err) {
        case 0:
            return fallback;
        case EINTR:
            return ErrorCode::Interrupted;
        case ENOENT:
            return ErrorCode::FileNotFound;
        case EEXIST:
            return ErrorCode::FileExists;
        case EACCES:
        case EPERM:
            return ErrorCode::FileAccessDenied;
        case ENOSPC:
            return ErrorCode::NoSpace;
        case ENOMEM:
            return ErrorCode::OutOfMemory;
        case EINVAL:
            return ErrorCode::InvalidArgument;
        default:
            return fallback;
    }
}

Error errorFromErrno(int err, ErrorCode fallback, const std::string& message,
                     const std::string& context) {
    Error error(errnoToCode(err, fallback),
                err != 0 ? fmt::format("{}: {}", message, std::strerror(err)) : message,
                context);
    if (err != 0) {
        error.native_code = err;
    }
    return error;
}

} // namespace core
} // namespace formsave
