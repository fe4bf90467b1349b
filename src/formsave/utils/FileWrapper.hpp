/**
 * @file FileWrapper.hpp
 * @brief RAII文件描述符包装器
 */

#pragma once

#include "formsave/core/Expected.hpp"
#include <string>
#include <sys/types.h>

namespace formsave {
namespace utils {

/**
 * @brief RAII文件描述符包装器
 *
 * 独占一个 POSIX 文件描述符，析构时自动关闭。
 * 只能移动，不能拷贝。
 */
class FileWrapper {
public:
    FileWrapper() noexcept = default;

    /**
     * @brief 接管已有描述符的所有权
     */
    explicit FileWrapper(int fd) noexcept : fd_(fd) {}

    /**
     * @brief 打开文件，被信号打断时自动重试
     * @param path 文件路径
     * @param flags open(2) 标志
     * @param mode 新建文件的权限位
     */
    static core::Result<FileWrapper> open(const std::string& path, int flags, mode_t mode = 0666);

    ~FileWrapper();

    FileWrapper(FileWrapper&& other) noexcept;
    FileWrapper& operator=(FileWrapper&& other) noexcept;

    FileWrapper(const FileWrapper&) = delete;
    FileWrapper& operator=(const FileWrapper&) = delete;

    int get() const noexcept { return fd_; }

    explicit operator bool() const noexcept { return fd_ >= 0; }

    /**
     * @brief 释放描述符的所有权
     */
    int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    /**
     * @brief 显式关闭并返回关闭结果
     */
    core::VoidResult close();

private:
    int fd_ = -1;
};

} // namespace utils
} // namespace formsave
