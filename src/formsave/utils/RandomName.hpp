#pragma once

#include "formsave/core/Constants.hpp"
#include <string>

namespace formsave {
namespace utils {

/**
 * @brief 生成随机的字母数字名称（文件名/目录名）
 *
 * 进程内共享一个只播种一次的生成器，线程安全。
 */
std::string randomAlphanumeric(size_t length = core::Constants::kRandomNameLength);

} // namespace utils
} // namespace formsave
