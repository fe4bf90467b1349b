#pragma once

#include "formsave/core/SaveOptions.hpp"
#include "formsave/core/SaveResult.hpp"
#include "formsave/core/SavedData.hpp"
#include "formsave/io/IBufferedReader.hpp"
#include "formsave/io/StreamCopier.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace formsave {
namespace core {

using FieldSaveResult = SaveResult<SavedData, SavedData>;

/**
 * @brief 保存单个文件字段
 *
 * 内容先缓冲到内存，不超过 memory_threshold 时留在内存（Text 或 Bytes），
 * 超过时写入磁盘文件。各个入口只在目标路径的选择上不同。
 *
 * 用法:
 * @code
 * FieldSaver saver(body);
 * auto res = saver.sizeLimit(1024 * 1024).ignoreText().withDir("/var/uploads");
 * @endcode
 */
class FieldSaver {
public:
    explicit FieldSaver(io::IBufferedReader& body, SaveOptions options = SaveOptions())
        : body_(body), options_(std::move(options)) {}

    // ========== 配置 ==========

    FieldSaver& sizeLimit(uint64_t limit) { options_.size_limit = limit; return *this; }
    FieldSaver& memoryThreshold(size_t threshold) { options_.memory_threshold = threshold; return *this; }
    FieldSaver& tryText() { options_.text_policy = TextPolicy::Try; return *this; }
    FieldSaver& forceText() { options_.text_policy = TextPolicy::Force; return *this; }
    FieldSaver& ignoreText() { options_.text_policy = TextPolicy::Ignore; return *this; }

    /**
     * @brief 修改文件打开选项；write 始终保持开启
     */
    template<typename F>
    FieldSaver& modOpenOptions(F&& func) {
        std::forward<F>(func)(options_.open_options);
        options_.open_options.write(true);
        return *this;
    }

    const SaveOptions& options() const { return options_; }

    // ========== 保存入口 ==========

    /**
     * @brief 在系统临时目录下以随机名称保存
     */
    FieldSaveResult temp();

    /**
     * @brief 在系统临时目录下以指定名称保存
     * @note 文件名不做任何过滤
     */
    FieldSaveResult withFilename(const std::string& filename);

    /**
     * @brief 在指定目录下以随机名称保存
     */
    FieldSaveResult withDir(const std::filesystem::path& dir);

    FieldSaveResult withPath(const std::filesystem::path& path);

    /**
     * @brief 直接拷贝到任意 writer（遵守 size_limit，不做内存/磁盘判断）
     */
    io::StreamCopier::CopyResult writeTo(io::IWriter& writer);

private:
    FieldSaveResult resolveInMemory(std::vector<uint8_t> buffer) const;
    FieldSaveResult spill(const std::filesystem::path& path, std::vector<uint8_t> buffer);

    io::IBufferedReader& body_;
    SaveOptions options_;
};

} // namespace core
} // namespace formsave
