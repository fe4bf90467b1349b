#pragma once

#include "formsave/core/SaveResult.hpp"
#include "formsave/io/IBufferedReader.hpp"
#include "formsave/io/IWriter.hpp"
#include <cstdint>

namespace formsave {
namespace io {

/**
 * @brief 流拷贝原语
 *
 * 所有函数都返回三态结果：
 * - Full：全部完成
 * - Partial：已经传输了部分字节后停止，值为已传输的字节数
 * - Error：一个字节都没有传输
 *
 * ErrorCode::Interrupted 在这里重试，不会出现在返回值中。
 */
class StreamCopier {
public:
    using WriteResult = core::SaveResult<size_t, size_t>;
    using CopyResult = core::SaveResult<uint64_t, uint64_t>;

    /**
     * @brief 把整个缓冲区写入 writer
     *
     * write 返回 0 视为 WriteZero 错误。
     */
    static WriteResult tryWriteAll(const uint8_t* data, size_t size, IWriter& writer);

    static WriteResult tryWriteAll(core::ByteView data, IWriter& writer) {
        return tryWriteAll(data.data(), data.size(), writer);
    }

    /**
     * @brief 从 reader 拷贝到 writer 直至流结束
     *
     * 只消费已经成功写出的字节，失败时 reader 停在第一个未写出的字节上。
     */
    static CopyResult tryCopyBuffered(IBufferedReader& reader, IWriter& writer);

    /**
     * @brief 最多拷贝 limit 个字节
     *
     * 拷满 limit 后再探测一次 reader：仍有数据返回 Partial(limit, SizeLimit)，
     * 已到流结束返回 Full(limit)。
     */
    static CopyResult tryCopyLimited(IBufferedReader& reader, IWriter& writer, uint64_t limit);
};

} // namespace io
} // namespace formsave
