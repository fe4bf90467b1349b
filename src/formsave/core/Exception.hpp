/**
 * @file Exception.hpp
 * @brief formsave异常类定义
 *
 * 正常的数据/IO 状况一律通过 SaveResult / Expected 返回；
 * 异常只用于调用方违反前置条件的编程错误。
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "formsave/core/ErrorCode.hpp"

namespace formsave {
namespace core {

/**
 * @brief formsave基础异常类
 */
class FormSaveException : public std::runtime_error {
public:
    /**
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    FormSaveException(const std::string& message,
                      ErrorCode code = ErrorCode::InternalError,
                      const char* file = nullptr,
                      int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    /**
     * @brief 获取详细错误信息（错误码 + 位置 + 上下文）
     */
    std::string getDetailedMessage() const;

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 把 Error 值转换为异常抛出
 */
[[noreturn]] void throwError(const Error& error);

} // namespace core
} // namespace formsave
