#include "formsave/core/FieldSaver.hpp"
#include "formsave/io/FileWriter.hpp"
#include "formsave/io/VectorWriter.hpp"
#include "formsave/utils/ModuleLoggers.hpp"
#include "formsave/utils/RandomName.hpp"
#include <utf8.h>
#include <system_error>

namespace formsave {
namespace core {

namespace fs = std::filesystem;

namespace {

Result<fs::path> systemTempDir() {
    std::error_code ec;
    fs::path dir = fs::temp_directory_path(ec);
    if (ec) {
        return errorFromErrno(ec.value(), ErrorCode::FileNotFound, "cannot locate system temp directory");
    }
    return dir;
}

} // namespace

FieldSaveResult FieldSaver::temp() {
    auto dir = systemTempDir();
    if (!dir) {
        return FieldSaveResult::error(std::move(dir).error());
    }
    return withPath(*dir / utils::randomAlphanumeric());
}

FieldSaveResult FieldSaver::withFilename(const std::string& filename) {
    auto dir = systemTempDir();
    if (!dir) {
        return FieldSaveResult::error(std::move(dir).error());
    }
    return withPath(*dir / filename);
}

FieldSaveResult FieldSaver::withDir(const fs::path& dir) {
    return withPath(dir / utils::randomAlphanumeric());
}

FieldSaveResult FieldSaver::withPath(const fs::path& path) {
    std::vector<uint8_t> buffer;
    io::VectorWriter memory(buffer);

    if (options_.size_limit && *options_.size_limit < options_.memory_threshold) {
        // 上限小于阈值：内容不可能落盘
        auto res = io::StreamCopier::tryCopyLimited(body_, memory, *options_.size_limit);
        if (res.isError()) {
            return FieldSaveResult::error(std::move(res).errorValue());
        }
        if (res.isPartial()) {
            SAVE_DEBUG("field stopped in memory after {} bytes: {}", buffer.size(), res.reason().describe());
            return FieldSaveResult::partial(SavedData::bytes(std::move(buffer)), std::move(res).reason());
        }
        return resolveInMemory(std::move(buffer));
    }

    auto res = io::StreamCopier::tryCopyLimited(body_, memory, options_.memory_threshold);
    if (res.isError()) {
        return FieldSaveResult::error(std::move(res).errorValue());
    }
    if (res.isFull()) {
        return resolveInMemory(std::move(buffer));
    }
    if (!res.reason().isSizeLimit()) {
        return FieldSaveResult::partial(SavedData::bytes(std::move(buffer)), std::move(res).reason());
    }

    return spill(path, std::move(buffer));
}

io::StreamCopier::CopyResult FieldSaver::writeTo(io::IWriter& writer) {
    if (options_.size_limit) {
        return io::StreamCopier::tryCopyLimited(body_, writer, *options_.size_limit);
    }
    return io::StreamCopier::tryCopyBuffered(body_, writer);
}

FieldSaveResult FieldSaver::resolveInMemory(std::vector<uint8_t> buffer) const {
    if (options_.text_policy == TextPolicy::Ignore) {
        return FieldSaveResult::full(SavedData::bytes(std::move(buffer)));
    }

    if (utf8::is_valid(buffer.begin(), buffer.end())) {
        return FieldSaveResult::full(SavedData::text(std::string(buffer.begin(), buffer.end())));
    }

    if (options_.text_policy == TextPolicy::Force) {
        return FieldSaveResult::error(Error(ErrorCode::InvalidData));
    }
    return FieldSaveResult::full(SavedData::bytes(std::move(buffer)));
}

FieldSaveResult FieldSaver::spill(const fs::path& path, std::vector<uint8_t> buffer) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return FieldSaveResult::error(errorFromErrno(ec.value(), ErrorCode::DirectoryCreateError,
                                                         "failed to create parent directory",
                                                         path.parent_path().string()));
        }
    }

    auto opened = io::FileWriter::open(path.string(), options_.open_options);
    if (!opened) {
        SAVE_WARN("cannot open {} for writing: {}", path.string(), opened.error().fullMessage());
        return FieldSaveResult::error(std::move(opened).error());
    }
    io::FileWriter& file = *opened;
    SAVE_DEBUG("spilling field to {} ({} bytes buffered)", path.string(), buffer.size());

    auto head = io::StreamCopier::tryWriteAll(buffer.data(), buffer.size(), file);
    if (!head.isFull()) {
        // 文件已经创建，即使一个字节都没写出也按 Partial 报告路径
        uint64_t written = head.isPartial() ? head.partialValue() : 0;
        Error err = head.isPartial() ? std::move(head).reason().unwrapError() : std::move(head).errorValue();
        return FieldSaveResult::partial(SavedData::file(path, written), PartialReason::ioError(std::move(err)));
    }

    const uint64_t head_size = buffer.size();
    SavedData data = SavedData::file(path, head_size);
    buffer.clear();
    buffer.shrink_to_fit();

    auto rest = options_.size_limit
        ? io::StreamCopier::tryCopyLimited(body_, file, *options_.size_limit - head_size)
        : io::StreamCopier::tryCopyBuffered(body_, file);

    if (rest.isError()) {
        return FieldSaveResult::partial(std::move(data), PartialReason::ioError(std::move(rest).errorValue()));
    }
    if (rest.isPartial()) {
        data.addSize(rest.partialValue());
        SAVE_DEBUG("field spilled partially to {} ({} bytes): {}", path.string(), data.asFile().size,
                   rest.reason().describe());
        return FieldSaveResult::partial(std::move(data), std::move(rest).reason());
    }
    data.addSize(rest.fullValue());

    auto closed = file.close();
    if (!closed) {
        return FieldSaveResult::partial(std::move(data), PartialReason::ioError(std::move(closed).error()));
    }
    return FieldSaveResult::full(std::move(data));
}

} // namespace core
} // namespace formsave
