#include "formsave/io/StreamCopier.hpp"
#include "formsave/io/LimitedReader.hpp"
#include "formsave/utils/ModuleLoggers.hpp"

namespace formsave {
namespace io {

namespace {

// 读取一次，被打断时重试
core::Result<core::ByteView> fillRetrying(IBufferedReader& reader) {
    for (;;) {
        auto buf = reader.fillBuffer();
        if (buf.hasError() && buf.error().isInterrupted()) {
            FORMSAVE_LOG_COPY_TRACE("fillBuffer interrupted, retrying");
            continue;
        }
        return buf;
    }
}

} // namespace

StreamCopier::WriteResult StreamCopier::tryWriteAll(const uint8_t* data, size_t size, IWriter& writer) {
    size_t written = 0;
    while (written < size) {
        auto n = writer.write(data + written, size - written);
        if (n.hasError()) {
            if (n.error().isInterrupted()) {
                FORMSAVE_LOG_COPY_TRACE("write interrupted on {}, retrying", writer.getTypeName());
                continue;
            }
            IO_DEBUG("write to {} failed after {} bytes: {}", writer.getTypeName(), written,
                     n.error().fullMessage());
            if (written == 0) {
                return WriteResult::error(std::move(n).error());
            }
            return WriteResult::partial(written, core::PartialReason::ioError(std::move(n).error()));
        }
        if (*n == 0) {
            core::Error err(core::ErrorCode::WriteZero);
            if (written == 0) {
                return WriteResult::error(std::move(err));
            }
            return WriteResult::partial(written, core::PartialReason::ioError(std::move(err)));
        }
        written += *n;
    }
    return WriteResult::full(written);
}

StreamCopier::CopyResult StreamCopier::tryCopyBuffered(IBufferedReader& reader, IWriter& writer) {
    uint64_t total = 0;
    for (;;) {
        auto buf = fillRetrying(reader);
        if (buf.hasError()) {
            IO_DEBUG("read failed after {} bytes: {}", total, buf.error().fullMessage());
            if (total == 0) {
                return CopyResult::error(std::move(buf).error());
            }
            return CopyResult::partial(total, core::PartialReason::ioError(std::move(buf).error()));
        }

        const core::ByteView chunk = *buf;
        if (chunk.empty()) {
            break;
        }

        auto res = tryWriteAll(chunk, writer);
        if (res.isFull()) {
            reader.consume(chunk.size());
            total += chunk.size();
            FORMSAVE_LOG_COPY_TRACE("copied chunk of {} bytes, total {}", chunk.size(), total);
            continue;
        }

        if (res.isPartial()) {
            const size_t n = res.partialValue();
            reader.consume(n);
            total += n;
            return CopyResult::partial(total, std::move(res).reason());
        }

        if (total == 0) {
            return CopyResult::error(std::move(res).errorValue());
        }
        return CopyResult::partial(total, core::PartialReason::ioError(std::move(res).errorValue()));
    }
    return CopyResult::full(total);
}

StreamCopier::CopyResult StreamCopier::tryCopyLimited(IBufferedReader& reader, IWriter& writer, uint64_t limit) {
    uint64_t copied = 0;
    {
        LimitedReader limited(reader, limit);
        auto res = tryCopyBuffered(limited, writer);
        if (!res.isFull()) {
            return res;
        }
        copied = res.fullValue();
    }

    // 流在上限之前结束
    if (copied < limit) {
        return CopyResult::full(copied);
    }

    auto peek = fillRetrying(reader);
    if (peek.hasError()) {
        return CopyResult::partial(copied, core::PartialReason::ioError(std::move(peek).error()));
    }
    if (peek->empty()) {
        return CopyResult::full(copied);
    }
    IO_DEBUG("size limit of {} bytes reached", limit);
    return CopyResult::partial(copied, core::PartialReason::sizeLimit());
}

} // namespace io
} // namespace formsave
