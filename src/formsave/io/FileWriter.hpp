#pragma once

#include "formsave/io/IWriter.hpp"
#include "formsave/core/OpenOptions.hpp"
#include "formsave/utils/FileWrapper.hpp"
#include <string>

namespace formsave {
namespace io {

/**
 * @brief 写入磁盘文件
 *
 * 每次 write() 直接对应一次 write(2)，不做额外缓冲，
 * 短写与 EINTR 由上层的 tryWriteAll 处理。
 */
class FileWriter : public IWriter {
public:
    /**
     * @brief 按 OpenOptions 打开（或新建）文件
     */
    static core::Result<FileWriter> open(const std::string& path, const core::OpenOptions& options);

    FileWriter(FileWriter&&) noexcept = default;
    FileWriter& operator=(FileWriter&&) noexcept = default;

    core::Result<size_t> write(const uint8_t* data, size_t size) override;

    const char* getTypeName() const override { return "FileWriter"; }

    const std::string& path() const { return path_; }

    /**
     * @brief 关闭文件，返回关闭时的错误（如延迟报告的写入失败）
     */
    core::VoidResult close() { return file_.close(); }

private:
    FileWriter(utils::FileWrapper file, std::string path)
        : file_(std::move(file)), path_(std::move(path)) {}

    utils::FileWrapper file_;
    std::string path_;
};

} // namespace io
} // namespace formsave
