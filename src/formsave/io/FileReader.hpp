#pragma once

#include "formsave/io/IBufferedReader.hpp"
#include "formsave/utils/FileWrapper.hpp"
#include "formsave/core/Constants.hpp"
#include <memory>
#include <string>
#include <vector>

namespace formsave {
namespace io {

/**
 * @brief 带缓冲地读取磁盘文件
 *
 * 用于把已保存到磁盘的字段重新流式读出。
 */
class FileReader : public IBufferedReader {
public:
    static core::Result<std::unique_ptr<FileReader>> open(const std::string& path,
                                                          size_t buffer_size = core::Constants::kIOBufferSize);

    core::Result<core::ByteView> fillBuffer() override;

    void consume(size_t amount) override;

    const std::string& path() const { return path_; }

private:
    FileReader(utils::FileWrapper file, std::string path, size_t buffer_size)
        : file_(std::move(file)), path_(std::move(path)), buffer_(buffer_size == 0 ? 1 : buffer_size) {}

    utils::FileWrapper file_;
    std::string path_;
    std::vector<uint8_t> buffer_;
    size_t pos_ = 0;
    size_t len_ = 0;
    bool eof_ = false;
};

} // namespace io
} // namespace formsave
