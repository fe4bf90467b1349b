#pragma once

#include "formsave/core/Expected.hpp"
#include <sys/types.h>

namespace formsave {
namespace core {

/**
 * @brief 文件打开选项（映射到 open(2) 标志）
 *
 * 保存时使用 forSave()（write + createNew）：目标已存在时打开失败，
 * 不会覆盖其他请求写出的文件。
 */
class OpenOptions {
public:
    OpenOptions() = default;

    /**
     * @brief 保存文件时使用的默认选项
     */
    static OpenOptions forSave() {
        OpenOptions opts;
        opts.write(true).createNew(true);
        return opts;
    }

    OpenOptions& read(bool v) { read_ = v; return *this; }
    OpenOptions& write(bool v) { write_ = v; return *this; }
    OpenOptions& append(bool v) { append_ = v; return *this; }
    OpenOptions& truncate(bool v) { truncate_ = v; return *this; }
    OpenOptions& create(bool v) { create_ = v; return *this; }
    OpenOptions& createNew(bool v) { create_new_ = v; return *this; }
    OpenOptions& mode(mode_t m) { mode_ = m; return *this; }

    bool isRead() const { return read_; }
    bool isWrite() const { return write_; }
    bool isAppend() const { return append_; }
    bool isTruncate() const { return truncate_; }
    bool isCreate() const { return create_; }
    bool isCreateNew() const { return create_new_; }
    mode_t getMode() const { return mode_; }

    /**
     * @brief 计算 open(2) 的 flags
     * @return 选项组合非法时返回 InvalidArgument
     */
    Result<int> toNativeFlags() const;

private:
    bool read_ = false;
    bool write_ = false;
    bool append_ = false;
    bool truncate_ = false;
    bool create_ = false;
    bool create_new_ = false;
    mode_t mode_ = 0666;
};

} // namespace core
} // namespace formsave
