#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include <fmt/format.h>

namespace formsave {
namespace core {

/**
 * @brief formsave统一错误码
 *
 * 所有文件系统/流错误都归入这里，以 Error 值的形式在
 * Expected / SaveResult 中传递，不走异常。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    OutOfMemory = 2,
    InternalError = 3,
    InvalidState = 4,

    // 流操作错误 (20-39)
    Interrupted = 20,     // EINTR，只在最底层重试，不会返回给调用方
    WriteZero = 21,       // write 返回 0：无法继续的短写
    InvalidData = 22,     // Force 策略下内容不是合法 UTF-8
    SourceReadError = 23, // 字段来源（上游连接）读取失败
    StreamReadError = 24,
    StreamWriteError = 25,

    // 文件系统错误 (40-59)
    FileNotFound = 40,
    FileExists = 41,
    FileAccessDenied = 42,
    FileOpenError = 43,
    FileWriteError = 44,
    FileReadError = 45,
    DirectoryCreateError = 46,
    DirectoryRemoveError = 47,
    NoSpace = 48
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;            // 额外上下文信息（通常是路径）
    std::optional<int> native_code; // 原始 errno

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }
    bool isInterrupted() const noexcept { return code == ErrorCode::Interrupted; }

    std::string fullMessage() const;
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief errno 映射到错误码；fallback 用于没有专门映射的 errno
 */
ErrorCode errnoToCode(int err, ErrorCode fallback) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

/**
 * @brief 从 errno 构造错误，消息附带 strerror 文本
 */
Error errorFromErrno(int err, ErrorCode fallback, const std::string& message,
                     const std::string& context = std::string());

} // namespace core
} // namespace formsave
