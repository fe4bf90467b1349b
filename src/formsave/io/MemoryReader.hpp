#pragma once

#include "formsave/io/IBufferedReader.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace formsave {
namespace io {

/**
 * @brief 读取一段内存（不拥有数据）
 *
 * chunk_size 限制每次 fillBuffer() 暴露的字节数，0 表示一次全部暴露。
 */
class MemoryReader : public IBufferedReader {
public:
    explicit MemoryReader(core::ByteView data, size_t chunk_size = 0)
        : data_(data), chunk_size_(chunk_size) {}

    explicit MemoryReader(const std::vector<uint8_t>& bytes, size_t chunk_size = 0)
        : MemoryReader(core::ByteView(bytes.data(), bytes.size()), chunk_size) {}

    explicit MemoryReader(const std::string& text, size_t chunk_size = 0)
        : MemoryReader(core::ByteView(reinterpret_cast<const uint8_t*>(text.data()), text.size()),
                       chunk_size) {}

    core::Result<core::ByteView> fillBuffer() override {
        core::ByteView rest = data_.subspan(pos_);
        return chunk_size_ == 0 ? rest : rest.first(chunk_size_);
    }

    void consume(size_t amount) override {
        pos_ = std::min(pos_ + amount, data_.size());
    }

    size_t remaining() const { return data_.size() - pos_; }

private:
    core::ByteView data_;
    size_t chunk_size_;
    size_t pos_ = 0;
};

} // namespace io
} // namespace formsave
