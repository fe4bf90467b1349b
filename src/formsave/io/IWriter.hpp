#pragma once

#include "formsave/core/Expected.hpp"
#include <cstddef>
#include <cstdint>

namespace formsave {
namespace io {

/**
 * @brief 统一的写入接口 - 策略模式
 *
 * 内存缓冲和磁盘文件共用这一接口，拷贝原语不关心目标是哪一种。
 */
class IWriter {
public:
    virtual ~IWriter() = default;

    /**
     * @brief 写入最多 size 个字节
     * @return 实际写入的字节数；被信号打断时返回 ErrorCode::Interrupted
     */
    virtual core::Result<size_t> write(const uint8_t* data, size_t size) = 0;

    /**
     * @brief 获取写入器类型名称（用于调试）
     */
    virtual const char* getTypeName() const = 0;
};

} // namespace io
} // namespace formsave
