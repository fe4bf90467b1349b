#pragma once

#include "formsave/io/IBufferedReader.hpp"
#include "formsave/io/IWriter.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace formsave {
namespace test {

// 生成可预测的二进制测试数据
inline std::vector<uint8_t> makeBinaryData(size_t size, uint8_t seed = 0) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>((i * 31 + seed) % 251);
    }
    return data;
}

inline std::vector<uint8_t> toBytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

/**
 * @brief 按固定块大小暴露数据，每 interrupt_every 次 fill 返回一次 Interrupted，
 *        读到 fail_at 字节处返回错误
 */
class ScriptedReader : public io::IBufferedReader {
public:
    explicit ScriptedReader(std::vector<uint8_t> data, size_t chunk = 0)
        : data_(std::move(data)), chunk_(chunk) {}

    ScriptedReader& interruptEvery(size_t n) { interrupt_every_ = n; return *this; }
    ScriptedReader& failAt(size_t offset) { fail_at_ = offset; return *this; }

    core::Result<core::ByteView> fillBuffer() override {
        ++fills_;
        if (interrupt_every_ != 0 && fills_ % interrupt_every_ == 0) {
            ++interrupts_;
            return core::Error(core::ErrorCode::Interrupted);
        }
        if (pos_ >= fail_at_) {
            return core::makeError(core::ErrorCode::StreamReadError, "scripted read failure");
        }
        size_t end = std::min(data_.size(), fail_at_);
        core::ByteView rest(data_.data() + pos_, end - pos_);
        return chunk_ == 0 ? rest : rest.first(chunk_);
    }

    void consume(size_t amount) override {
        pos_ = std::min(pos_ + amount, data_.size());
    }

    size_t position() const { return pos_; }
    size_t interrupts() const { return interrupts_; }

private:
    std::vector<uint8_t> data_;
    size_t chunk_;
    size_t pos_ = 0;
    size_t fills_ = 0;
    size_t interrupt_every_ = 0;
    size_t interrupts_ = 0;
    size_t fail_at_ = static_cast<size_t>(-1);
};

/**
 * @brief 可控的写入器：限制单次写入量、周期性返回 Interrupted、
 *        写满 capacity 后返回错误或 0
 */
class ScriptedWriter : public io::IWriter {
public:
    enum class OnFull { Fail, WriteZero };

    ScriptedWriter& maxPerWrite(size_t n) { max_per_write_ = n; return *this; }
    ScriptedWriter& interruptEvery(size_t n) { interrupt_every_ = n; return *this; }
    ScriptedWriter& capacity(size_t n, OnFull mode = OnFull::Fail) {
        capacity_ = n;
        on_full_ = mode;
        return *this;
    }

    core::Result<size_t> write(const uint8_t* data, size_t size) override {
        ++calls_;
        if (interrupt_every_ != 0 && calls_ % interrupt_every_ == 0) {
            return core::Error(core::ErrorCode::Interrupted);
        }
        if (written_.size() >= capacity_) {
            if (on_full_ == OnFull::WriteZero) {
                return size_t(0);
            }
            return core::makeError(core::ErrorCode::NoSpace, "scripted write failure");
        }
        size_t n = std::min({size, max_per_write_, capacity_ - written_.size()});
        written_.insert(written_.end(), data, data + n);
        return n;
    }

    const char* getTypeName() const override { return "ScriptedWriter"; }

    const std::vector<uint8_t>& written() const { return written_; }

private:
    std::vector<uint8_t> written_;
    size_t calls_ = 0;
    size_t max_per_write_ = static_cast<size_t>(-1);
    size_t interrupt_every_ = 0;
    size_t capacity_ = static_cast<size_t>(-1);
    OnFull on_full_ = OnFull::Fail;
};

} // namespace test
} // namespace formsave
