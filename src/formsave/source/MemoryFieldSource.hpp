#pragma once

#include "formsave/source/FieldSource.hpp"
#include <deque>
#include <optional>
#include <vector>

namespace formsave {
namespace source {

/**
 * @brief 内存中的字段来源
 *
 * 字段预先解析好放在内存中，按添加顺序产出。
 * 主要用于测试和示例，也可以包装任何已经完整读入内存的请求。
 */
class MemoryFieldSource : public IFieldSource {
public:
    /**
     * @param chunk_size 每次 fillBuffer() 暴露的最大字节数，0 表示不限制
     */
    explicit MemoryFieldSource(size_t chunk_size = 0) : chunk_size_(chunk_size) {}

    MemoryFieldSource& addText(const std::string& name, std::string value);

    MemoryFieldSource& addFile(const std::string& name, std::vector<uint8_t> content,
                               std::optional<std::string> filename = std::nullopt,
                               std::optional<std::string> content_type = std::nullopt);

    MemoryFieldSource& addFile(const std::string& name, const std::string& content,
                               std::optional<std::string> filename = std::nullopt,
                               std::optional<std::string> content_type = std::nullopt);

    /**
     * @brief 在当前位置插入一次来源错误（模拟连接中断）
     */
    MemoryFieldSource& addError(core::Error error);

    FieldReadResult readField() override;

    void reclaim(std::unique_ptr<FieldBody> body) override;

    size_t pendingCount() const { return pending_.size(); }
    bool hasOutstandingBody() const { return outstanding_; }

private:
    struct Pending {
        core::FieldHeaders headers;
        std::optional<std::string> text;
        std::vector<uint8_t> content;
        std::optional<core::Error> error;
    };

    size_t chunk_size_;
    std::deque<Pending> pending_;
    bool outstanding_ = false;
};

} // namespace source
} // namespace formsave
