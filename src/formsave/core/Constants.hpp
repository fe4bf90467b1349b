#pragma once

#include <cstddef>
#include <cstdint>

namespace formsave {
namespace core {

/**
 * @brief 全局常量
 */
struct Constants {
    // 字段内容超过该阈值时落盘，否则保留在内存（8 MiB）
    static constexpr size_t kDefaultMemoryThreshold = 8 * 1024 * 1024;

    // 随机文件名/目录名长度
    static constexpr size_t kRandomNameLength = 12;

    // 临时目录名前缀
    static constexpr const char* kDefaultTempPrefix = "formsave";

    // 文件读取缓冲区大小
    static constexpr size_t kIOBufferSize = 8192;
};

} // namespace core
} // namespace formsave
