#pragma once

#include "formsave/core/Constants.hpp"
#include "formsave/core/OpenOptions.hpp"
#include <cstdint>
#include <optional>

namespace formsave {
namespace core {

/**
 * @brief 内存中的内容是否按文本处理
 */
enum class TextPolicy : uint8_t {
    Try,    // 合法 UTF-8 时保存为 Text，否则保存为 Bytes
    Force,  // 必须是合法 UTF-8，否则返回 InvalidData 错误
    Ignore  // 始终保存为 Bytes
};

/**
 * @brief 保存配置
 *
 * 体积小、可拷贝；同一份配置可以复制给每个文件字段使用。
 */
struct SaveOptions {
    std::optional<uint64_t> size_limit;   // 每个文件字段最多保存的字节数
    std::optional<uint32_t> count_limit;  // 每个请求最多处理的文件字段数
    size_t memory_threshold = Constants::kDefaultMemoryThreshold;
    TextPolicy text_policy = TextPolicy::Try;
    OpenOptions open_options = OpenOptions::forSave();
};

} // namespace core
} // namespace formsave
