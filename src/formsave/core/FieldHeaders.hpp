#pragma once

#include <optional>
#include <string>

namespace formsave {
namespace core {

/**
 * @brief 字段的 Content-Disposition / Content-Type 信息
 */
struct FieldHeaders {
    std::string name;
    std::optional<std::string> filename;
    std::optional<std::string> content_type;

    FieldHeaders() = default;
    explicit FieldHeaders(std::string field_name) : name(std::move(field_name)) {}
    FieldHeaders(std::string field_name, std::optional<std::string> file_name,
                 std::optional<std::string> type = std::nullopt)
        : name(std::move(field_name)), filename(std::move(file_name)), content_type(std::move(type)) {}
};

} // namespace core
} // namespace formsave
