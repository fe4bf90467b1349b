/**
 * @file Exception.cpp
 * @brief formsave异常类实现
 */

#include "formsave/core/Exception.hpp"
#include <fmt/format.h>

namespace formsave {
namespace core {

FormSaveException::FormSaveException(const std::string& message,
                                     ErrorCode code,
                                     const char* file,
                                     int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string FormSaveException::getDetailedMessage() const {
    std::string out = fmt::format("[{}] {}", toString(error_code_), what());

    if (file_ && line_ > 0) {
        out += fmt::format(" (at {}:{})", file_, line_);
    }

    if (!context_.empty()) {
        out += "\nContext:";
        for (const auto& ctx : context_) {
            out += "\n  - " + ctx;
        }
    }

    return out;
}

void FormSaveException::addContext(const std::string& context) {
    context_.push_back(context);
}

void throwError(const Error& error) {
    FormSaveException ex(error.fullMessage(), error.code);
    if (!error.context.empty()) {
        ex.addContext(error.context);
    }
    throw ex;
}

} // namespace core
} // namespace formsave
