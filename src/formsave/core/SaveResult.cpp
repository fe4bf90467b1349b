#include "formsave/core/SaveResult.hpp"
#include "formsave/core/Exception.hpp"
#include <fmt/format.h>

namespace formsave {
namespace core {

Error PartialReason::expectError(const std::string& msg) && {
    if (kind_ != Kind::IoError || !error_) {
        throw FormSaveException(fmt::format("{}: {}", msg, describe()),
                                ErrorCode::InvalidState, __FILE__, __LINE__);
    }
    return std::move(*error_);
}

std::string PartialReason::describe() const {
    switch (kind_) {
        case Kind::CountLimit:
            return "CountLimit";
        case Kind::SizeLimit:
            return "SizeLimit";
        case Kind::IoError:
            return fmt::format("IoError({})", error_ ? error_->fullMessage() : std::string("?"));
    }
    return "Unknown";
}

} // namespace core
} // namespace formsave
