#pragma once

#include "formsave/core/Expected.hpp"
#include "formsave/core/span.hpp"
#include <cstddef>

namespace formsave {
namespace io {

/**
 * @brief 带内部缓冲的读取接口
 *
 * fillBuffer() 填充并返回内部缓冲区中尚未消费的数据，不消费任何字节；
 * 返回空视图表示流结束。consume(n) 标记前 n 个字节已被使用。
 * 被信号打断时返回 ErrorCode::Interrupted，由调用方重试。
 */
class IBufferedReader {
public:
    virtual ~IBufferedReader() = default;

    virtual core::Result<core::ByteView> fillBuffer() = 0;

    virtual void consume(size_t amount) = 0;
};

} // namespace io
} // namespace formsave
