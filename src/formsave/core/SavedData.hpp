#pragma once

#include "formsave/core/Expected.hpp"
#include "formsave/core/FieldHeaders.hpp"
#include "formsave/io/IBufferedReader.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace formsave {
namespace core {

/**
 * @brief 字段内容最终的存放形式
 *
 * - Text：合法 UTF-8，保留在内存
 * - Bytes：二进制，保留在内存
 * - File：已写入磁盘，记录路径与字节数
 */
class SavedData {
public:
    struct Text {
        std::string value;
    };
    struct Bytes {
        std::vector<uint8_t> value;
    };
    struct File {
        std::filesystem::path path;
        uint64_t size = 0;
    };

    SavedData(Text text) : storage_(std::move(text)) {}
    SavedData(Bytes bytes) : storage_(std::move(bytes)) {}
    SavedData(File file) : storage_(std::move(file)) {}

    static SavedData text(std::string value) { return SavedData(Text{std::move(value)}); }
    static SavedData bytes(std::vector<uint8_t> value) { return SavedData(Bytes{std::move(value)}); }
    static SavedData file(std::filesystem::path path, uint64_t size) {
        return SavedData(File{std::move(path), size});
    }

    bool isText() const noexcept { return std::holds_alternative<Text>(storage_); }
    bool isBytes() const noexcept { return std::holds_alternative<Bytes>(storage_); }
    bool isFile() const noexcept { return std::holds_alternative<File>(storage_); }

    // 调用前先检查类型
    const std::string& asText() const { return std::get<Text>(storage_).value; }
    const std::vector<uint8_t>& asBytes() const { return std::get<Bytes>(storage_).value; }
    const File& asFile() const { return std::get<File>(storage_); }

    /**
     * @brief 内容字节数
     */
    uint64_t size() const noexcept;

    /**
     * @brief 以流的形式重新读出内容
     *
     * Text / Bytes 返回引用自身内存的读取器，读取器不能比本对象活得更久；
     * File 重新打开磁盘文件。
     */
    Result<std::unique_ptr<io::IBufferedReader>> readable() const;

    /**
     * @brief 增加 File 记录的字节数（饱和加法），其它类型无效果
     */
    void addSize(uint64_t amount) noexcept;

private:
    std::variant<Text, Bytes, File> storage_;
};

/**
 * @brief 一条已保存的字段记录
 */
struct SavedField {
    FieldHeaders headers;
    SavedData data;

    SavedField(FieldHeaders h, SavedData d) : headers(std::move(h)), data(std::move(d)) {}
};

} // namespace core
} // namespace formsave
