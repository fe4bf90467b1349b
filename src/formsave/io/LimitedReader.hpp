#pragma once

#include "formsave/io/IBufferedReader.hpp"
#include <algorithm>
#include <cstdint>

namespace formsave {
namespace io {

/**
 * @brief 最多暴露 limit 个字节的读取视图
 *
 * 不拥有底层读取器；消费会同步到底层。达到上限后表现为流结束，
 * 底层剩余数据保持不动。
 */
class LimitedReader : public IBufferedReader {
public:
    LimitedReader(IBufferedReader& inner, uint64_t limit)
        : inner_(inner), remaining_(limit) {}

    core::Result<core::ByteView> fillBuffer() override {
        if (remaining_ == 0) {
            return core::ByteView();
        }
        auto buf = inner_.fillBuffer();
        if (!buf) {
            return buf;
        }
        return buf->first(static_cast<size_t>(std::min<uint64_t>(remaining_, buf->size())));
    }

    void consume(size_t amount) override {
        const uint64_t n = std::min<uint64_t>(amount, remaining_);
        remaining_ -= n;
        inner_.consume(static_cast<size_t>(n));
    }

    uint64_t remaining() const { return remaining_; }

private:
    IBufferedReader& inner_;
    uint64_t remaining_;
};

} // namespace io
} // namespace formsave
