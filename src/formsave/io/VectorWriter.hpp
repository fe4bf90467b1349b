#pragma once

#include "formsave/io/IWriter.hpp"
#include <new>
#include <vector>

namespace formsave {
namespace io {

/**
 * @brief 追加写入到 std::vector<uint8_t>（不拥有目标）
 */
class VectorWriter : public IWriter {
public:
    explicit VectorWriter(std::vector<uint8_t>& target) : target_(target) {}

    core::Result<size_t> write(const uint8_t* data, size_t size) override {
        try {
            target_.insert(target_.end(), data, data + size);
        } catch (const std::bad_alloc&) {
            return core::makeError(core::ErrorCode::OutOfMemory, "memory buffer growth failed");
        }
        return size;
    }

    const char* getTypeName() const override { return "VectorWriter"; }

private:
    std::vector<uint8_t>& target_;
};

} // namespace io
} // namespace formsave
