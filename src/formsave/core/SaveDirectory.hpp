#pragma once

#include "formsave/core/Constants.hpp"
#include "formsave/core/Expected.hpp"
#include <filesystem>
#include <string>

namespace formsave {
namespace core {

/**
 * @brief 目录已不存在时 remove() 的处理方式
 */
enum class MissingDirPolicy : uint8_t {
    Fail,   // 返回 FileNotFound
    Ignore  // 视为成功
};

/**
 * @brief 保存字段文件的目录
 *
 * Temporary 目录随对象析构一起删除；Permanent 目录永远不会被自动删除。
 * 只能移动，不能拷贝。
 */
class SaveDirectory {
public:
    /**
     * @brief 在系统临时目录下新建一个随机命名的目录
     * @param prefix 目录名前缀
     */
    static Result<SaveDirectory> createTemp(const std::string& prefix = Constants::kDefaultTempPrefix);

    /**
     * @brief 接管一个已存在的目录，析构时删除
     */
    static SaveDirectory temporary(std::filesystem::path path) {
        return SaveDirectory(std::move(path), true);
    }

    static SaveDirectory permanent(std::filesystem::path path) {
        return SaveDirectory(std::move(path), false);
    }

    ~SaveDirectory();

    SaveDirectory(SaveDirectory&& other) noexcept;
    SaveDirectory& operator=(SaveDirectory&& other) noexcept;

    SaveDirectory(const SaveDirectory&) = delete;
    SaveDirectory& operator=(const SaveDirectory&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

    bool isTemporary() const noexcept { return temporary_; }

    /**
     * @brief 转为 Permanent，之后不再自动删除；已是 Permanent 时无操作
     */
    void keep() noexcept;

    /**
     * @brief 放弃所有权并返回路径（不会删除目录）
     */
    std::filesystem::path intoPath() &&;

    /**
     * @brief 立即删除目录及其全部内容，不区分 Temporary / Permanent
     *
     * 成功后对象不再拥有任何目录，析构时不会重复删除。
     */
    VoidResult remove(MissingDirPolicy policy = MissingDirPolicy::Fail);

private:
    SaveDirectory(std::filesystem::path path, bool temporary)
        : path_(std::move(path)), temporary_(temporary) {}

    std::filesystem::path path_;
    bool temporary_;
};

} // namespace core
} // namespace formsave
