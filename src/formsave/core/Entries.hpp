#pragma once

#include "formsave/core/SaveDirectory.hpp"
#include "formsave/core/SavedData.hpp"
#include "formsave/io/IWriter.hpp"
#include "formsave/source/FieldSource.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace formsave {
namespace core {

/**
 * @brief 一次请求中已保存的全部字段
 *
 * fields 中每个字段名对应的记录按到达顺序排列，且不为空。
 * save_dir 是文件字段所在的目录，Temporary 时随 Entries 一起删除。
 */
struct Entries {
    std::unordered_map<std::string, std::vector<SavedField>> fields;
    SaveDirectory save_dir;

    explicit Entries(SaveDirectory dir) : save_dir(std::move(dir)) {}

    bool isEmpty() const noexcept { return fields.empty(); }

    /**
     * @brief 取得某个字段名的记录列表（不存在时创建）
     */
    std::vector<SavedField>& fieldsFor(const std::string& name) { return fields[name]; }

    /**
     * @brief 记录总数（同名字段分别计数）
     */
    size_t fieldCount() const noexcept;

    void addField(SavedField field) {
        fieldsFor(field.headers.name).push_back(std::move(field));
    }
};

/**
 * @brief 保存中途停止时正在处理的字段
 */
struct PartialSavedField {
    std::string field_name;
    FieldHeaders headers;

    /**
     * @brief 字段内容流中尚未读取的部分；数量上限截断时完全未读
     */
    std::unique_ptr<source::FieldBody> body;

    /**
     * @brief 已经写出的部分内容；字段尚未开始或打开目标失败时为空
     */
    std::optional<SavedField> dest;

    /**
     * @brief 读完并丢弃剩余内容，返回丢弃的字节数
     *
     * 调用后 body 仍然保留，可以交还给来源。
     */
    Result<uint64_t> drainBody();

    /**
     * @brief 把剩余内容写入 writer（例如继续保存到别处）
     */
    Result<uint64_t> copyBodyTo(io::IWriter& writer);

    /**
     * @brief 取出 body 的所有权（例如交还给 IFieldSource::reclaim）
     */
    std::unique_ptr<source::FieldBody> takeBody() { return std::move(body); }
};

/**
 * @brief Partial / Error 时返回的结果：已保存的字段加上中断时的字段
 */
struct PartialEntries {
    Entries entries;
    std::optional<PartialSavedField> partial;

    explicit PartialEntries(Entries e, std::optional<PartialSavedField> p = std::nullopt)
        : entries(std::move(e)), partial(std::move(p)) {}

    /**
     * @brief 若中断字段已经写出了内容，将其并入 entries，然后返回 entries
     */
    Entries keepPartial() &&;

    /**
     * @brief 丢弃中断字段，只保留已完整保存的字段
     */
    explicit operator Entries() && { return std::move(entries); }
};

} // namespace core
} // namespace formsave
