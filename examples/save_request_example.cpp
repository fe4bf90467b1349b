#include "formsave/utils/ModuleLoggers.hpp"
/**
 * @file save_request_example.cpp
 * @brief formsave 基本用法示例
 *
 * 这个示例展示了：
 * - 保存一个包含文本字段和文件字段的请求
 * - 处理大小上限 / 数量上限造成的 Partial 结果
 * - 保留或丢弃临时保存目录
 */

#include "formsave/core/FieldSaver.hpp"
#include "formsave/core/RequestSaver.hpp"
#include "formsave/source/MemoryFieldSource.hpp"
#include <vector>

using namespace formsave;

namespace {

std::vector<uint8_t> fakeImage(size_t size) {
    std::vector<uint8_t> data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<uint8_t>(i * 7);
    }
    return data;
}

void describe(const core::Entries& entries) {
    EXAMPLE_INFO("save dir: {} ({})", entries.save_dir.path().string(),
                 entries.save_dir.isTemporary() ? "temporary" : "permanent");
    for (const auto& kv : entries.fields) {
        for (const auto& field : kv.second) {
            if (field.data.isText()) {
                EXAMPLE_INFO("   - {}: text \"{}\"", kv.first, field.data.asText());
            } else if (field.data.isBytes()) {
                EXAMPLE_INFO("   - {}: {} bytes in memory", kv.first, field.data.size());
            } else {
                EXAMPLE_INFO("   - {}: file {} ({} bytes)", kv.first,
                             field.data.asFile().path.string(), field.data.size());
            }
        }
    }
}

} // namespace

int main() {
    Logger::getInstance().initialize("logs/save_request_example.log", Logger::Level::INFO, true);

    EXAMPLE_INFO("formsave 基本用法示例");
    EXAMPLE_INFO("=====================");

    // 1. 完整保存：大文件落盘，短文本留在内存
    {
        source::MemoryFieldSource src(64 * 1024);
        src.addFile("avatar", fakeImage(3 * 1024 * 1024), std::string("me.png"), std::string("image/png"))
           .addText("bio", "hello world")
           .addFile("notes", std::string("short text file"), std::string("notes.txt"));

        auto res = core::RequestSaver(src).memoryThreshold(1024 * 1024).temp();
        if (res.isFull()) {
            EXAMPLE_INFO("1. 请求完整保存");
            describe(res.fullValue());
        } else {
            EXAMPLE_ERROR("1. 保存失败");
        }
        // res 析构时临时目录被删除
    }

    // 2. 大小上限：字段被截断，调用方选择保留已写出的部分
    {
        source::MemoryFieldSource src;
        src.addFile("upload", fakeImage(4096));

        auto res = core::RequestSaver(src).sizeLimit(1000).temp();
        if (res.isPartial()) {
            EXAMPLE_WARN("2. 字段被截断: {}", res.reason().describe());
            core::Entries entries = std::move(res).partialValue().keepPartial();
            describe(entries);
        }
    }

    // 3. 数量上限：被截断的字段完全未读，由调用方决定如何处理
    {
        source::MemoryFieldSource src;
        src.addFile("a", std::string("first")).addFile("b", std::string("second"));

        auto res = core::RequestSaver(src).countLimit(1).temp();
        if (res.isPartial() && res.reason().isCountLimit()) {
            core::PartialEntries pe = std::move(res).partialValue();
            auto drained = pe.partial->drainBody();
            if (drained) {
                EXAMPLE_WARN("3. 数量上限，丢弃字段 '{}' 的 {} 字节", pe.partial->field_name, *drained);
            }
            src.reclaim(pe.partial->takeBody());
            describe(pe.entries);
        }
    }

    // 4. 保留临时目录
    {
        source::MemoryFieldSource src;
        src.addFile("report", fakeImage(2048));

        auto res = core::RequestSaver(src).memoryThreshold(512).temp();
        if (res.isFull()) {
            core::Entries entries = std::move(res).fullValue();
            entries.save_dir.keep();
            EXAMPLE_INFO("4. 目录已保留: {}", entries.save_dir.path().string());
            auto removed = entries.save_dir.remove();
            if (!removed) {
                EXAMPLE_ERROR("4. 删除目录失败: {}", removed.error().fullMessage());
            }
        }
    }

    Logger::getInstance().shutdown();
    return 0;
}
