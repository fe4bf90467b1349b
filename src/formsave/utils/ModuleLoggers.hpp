#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 格式: [等级][模块] 消息
 */

// 保存流程 (save)
#define SAVE_DEBUG(...)    FORMSAVE_LOG_DEBUG("[DBG][save] " __VA_ARGS__)
#define SAVE_INFO(...)     FORMSAVE_LOG_INFO("[INF][save] " __VA_ARGS__)
#define SAVE_WARN(...)     FORMSAVE_LOG_WARN("[WRN][save] " __VA_ARGS__)
#define SAVE_ERROR(...)    FORMSAVE_LOG_ERROR("[ERR][save] " __VA_ARGS__)

// 流式读写 (io)
#define IO_TRACE(...)    FORMSAVE_LOG_TRACE("[TRC][io  ] " __VA_ARGS__)
#define IO_DEBUG(...)    FORMSAVE_LOG_DEBUG("[DBG][io  ] " __VA_ARGS__)
#define IO_WARN(...)     FORMSAVE_LOG_WARN("[WRN][io  ] " __VA_ARGS__)
#define IO_ERROR(...)    FORMSAVE_LOG_ERROR("[ERR][io  ] " __VA_ARGS__)

// 文件系统 / 保存目录 (fs)
#define FS_DEBUG(...)    FORMSAVE_LOG_DEBUG("[DBG][fs  ] " __VA_ARGS__)
#define FS_INFO(...)     FORMSAVE_LOG_INFO("[INF][fs  ] " __VA_ARGS__)
#define FS_WARN(...)     FORMSAVE_LOG_WARN("[WRN][fs  ] " __VA_ARGS__)
#define FS_ERROR(...)    FORMSAVE_LOG_ERROR("[ERR][fs  ] " __VA_ARGS__)

// 字段来源 (source)
#define SRC_DEBUG(...)    FORMSAVE_LOG_DEBUG("[DBG][src ] " __VA_ARGS__)
#define SRC_WARN(...)     FORMSAVE_LOG_WARN("[WRN][src ] " __VA_ARGS__)

// 示例 (examples)
#define EXAMPLE_INFO(...)     FORMSAVE_LOG_INFO("[INF][demo] " __VA_ARGS__)
#define EXAMPLE_WARN(...)     FORMSAVE_LOG_WARN("[WRN][demo] " __VA_ARGS__)
#define EXAMPLE_ERROR(...)    FORMSAVE_LOG_ERROR("[ERR][demo] " __VA_ARGS__)

// 条件日志宏
#if FORMSAVE_ENABLE_COPY_TRACE
    #define FORMSAVE_LOG_COPY_TRACE(...) IO_TRACE(__VA_ARGS__)
#else
    #define FORMSAVE_LOG_COPY_TRACE(...) do {} while(0)
#endif
