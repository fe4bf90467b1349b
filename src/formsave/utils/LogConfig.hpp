#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的日志，设置为 1 启用

#ifndef FORMSAVE_ENABLE_COPY_TRACE
#define FORMSAVE_ENABLE_COPY_TRACE 0    // 拷贝循环逐块跟踪日志（量很大）
#endif
