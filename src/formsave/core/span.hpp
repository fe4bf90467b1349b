#pragma once

#include <cstddef>
#include <cstdint>

namespace formsave {
namespace core {

// C++17兼容的轻量级span类
template<typename T>
class span {
public:
    using element_type = T;
    using size_type = std::size_t;
    using iterator = T*;

    constexpr span() noexcept : data_(nullptr), size_(0) {}
    constexpr span(T* data, size_type size) noexcept : data_(data), size_(size) {}

    constexpr iterator begin() const noexcept { return data_; }
    constexpr iterator end() const noexcept { return data_ + size_; }

    constexpr T* data() const noexcept { return data_; }
    constexpr size_type size() const noexcept { return size_; }
    constexpr bool empty() const noexcept { return size_ == 0; }

    constexpr T& operator[](size_type idx) const { return data_[idx]; }

    // 前 n 个元素（n 超出时截到 size）
    constexpr span first(size_type n) const noexcept {
        return span(data_, n < size_ ? n : size_);
    }

    // 跳过前 offset 个元素
    constexpr span subspan(size_type offset) const noexcept {
        return offset >= size_ ? span(data_ + size_, 0) : span(data_ + offset, size_ - offset);
    }

private:
    T* data_;
    size_type size_;
};

using ByteView = span<const uint8_t>;

} // namespace core
} // namespace formsave
