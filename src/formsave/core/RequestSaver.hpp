#pragma once

#include "formsave/core/Entries.hpp"
#include "formsave/core/SaveOptions.hpp"
#include "formsave/core/SaveResult.hpp"
#include "formsave/source/FieldSource.hpp"
#include <filesystem>
#include <string>

namespace formsave {
namespace core {

using EntriesSaveResult = SaveResult<Entries, PartialEntries>;

/**
 * @brief 取出 EntriesSaveResult 中的 Entries
 *
 * Full 与任何原因的 Partial 都返回已完整保存的字段，中断时的字段被丢弃
 * （需要保留它时先调用 PartialEntries::keepPartial()）。
 * 只有 Error 返回错误。
 */
Result<Entries> intoEntries(EntriesSaveResult result);

/**
 * @brief 保存整个请求的全部字段
 *
 * 按来源产出的顺序逐个处理字段：文本字段直接记录，文件字段交给
 * FieldSaver 保存到保存目录中。遇到上限或错误时停止，并返回已保存的
 * 字段和中断时的字段。
 *
 * 用法:
 * @code
 * RequestSaver saver(source);
 * auto res = saver.sizeLimit(10 * 1024 * 1024).countLimit(4).temp();
 * if (res.isFull()) {
 *     Entries entries = std::move(res).fullValue();
 * }
 * @endcode
 */
class RequestSaver {
public:
    explicit RequestSaver(source::IFieldSource& source, SaveOptions options = SaveOptions())
        : source_(source), options_(std::move(options)) {}

    // ========== 配置 ==========

    RequestSaver& sizeLimit(uint64_t limit) { options_.size_limit = limit; return *this; }
    RequestSaver& countLimit(uint32_t limit) { options_.count_limit = limit; return *this; }
    RequestSaver& memoryThreshold(size_t threshold) { options_.memory_threshold = threshold; return *this; }
    RequestSaver& tryText() { options_.text_policy = TextPolicy::Try; return *this; }
    RequestSaver& forceText() { options_.text_policy = TextPolicy::Force; return *this; }
    RequestSaver& ignoreText() { options_.text_policy = TextPolicy::Ignore; return *this; }

    template<typename F>
    RequestSaver& modOpenOptions(F&& func) {
        std::forward<F>(func)(options_.open_options);
        options_.open_options.write(true);
        return *this;
    }

    const SaveOptions& options() const { return options_; }

    // ========== 保存入口 ==========

    /**
     * @brief 保存到新建的临时目录（未调用 keep() 时随结果一起删除）
     */
    EntriesSaveResult temp() { return tempWithPrefix(Constants::kDefaultTempPrefix); }

    EntriesSaveResult tempWithPrefix(const std::string& prefix);

    EntriesSaveResult withTempDir(SaveDirectory dir);

    /**
     * @brief 保存到指定目录（不存在时创建），目录不会被自动删除
     */
    EntriesSaveResult withDir(const std::filesystem::path& dir);

    /**
     * @brief 继续向已有的 Entries 中保存
     *
     * 处理完一次 Partial 结果后，可以用它的 entries 从当前位置继续。
     * 数量上限只计算本次调用保存的文件字段。
     */
    EntriesSaveResult withEntries(Entries entries);

private:
    source::IFieldSource& source_;
    SaveOptions options_;
};

} // namespace core
} // namespace formsave
