#pragma once

#include "formsave/core/Expected.hpp"
#include "formsave/core/FieldHeaders.hpp"
#include "formsave/io/IBufferedReader.hpp"
#include <memory>
#include <string>
#include <variant>

namespace formsave {
namespace source {

/**
 * @brief 一个文件字段的内容流
 *
 * 带缓冲读取；用完后必须通过 IFieldSource::reclaim() 交还给来源，
 * 来源才能继续产出后面的字段。
 */
class FieldBody : public io::IBufferedReader {
public:
    /**
     * @brief 所属字段名（用于日志）
     */
    virtual const std::string& fieldName() const = 0;
};

/**
 * @brief 来源产出的一个字段
 */
struct MultipartField {
    struct Text {
        std::string value;
    };
    struct File {
        std::unique_ptr<FieldBody> body;
    };

    std::string name;
    core::FieldHeaders headers;
    std::variant<Text, File> data;

    bool isText() const noexcept { return std::holds_alternative<Text>(data); }
    bool isFile() const noexcept { return std::holds_alternative<File>(data); }
};

/**
 * @brief readField() 的结果：Field / End / Error
 */
class FieldReadResult {
public:
    struct End {};

    static FieldReadResult field(MultipartField f) { return FieldReadResult(std::move(f)); }
    static FieldReadResult end() { return FieldReadResult(End{}); }
    static FieldReadResult error(core::Error e) { return FieldReadResult(std::move(e)); }

    bool isField() const noexcept { return storage_.index() == 0; }
    bool isEnd() const noexcept { return storage_.index() == 1; }
    bool isError() const noexcept { return storage_.index() == 2; }

    MultipartField& field() { return std::get<MultipartField>(storage_); }
    const core::Error& error() const { return std::get<core::Error>(storage_); }
    core::Error takeError() { return std::move(std::get<core::Error>(storage_)); }

private:
    explicit FieldReadResult(MultipartField&& f) : storage_(std::move(f)) {}
    explicit FieldReadResult(End e) : storage_(e) {}
    explicit FieldReadResult(core::Error&& e) : storage_(std::move(e)) {}

    std::variant<MultipartField, End, core::Error> storage_;
};

/**
 * @brief 字段来源接口（拉取式）
 *
 * 实现负责 multipart 边界与头部解析；保存流程只依赖这里的接口。
 */
class IFieldSource {
public:
    virtual ~IFieldSource() = default;

    /**
     * @brief 读取下一个字段
     */
    virtual FieldReadResult readField() = 0;

    /**
     * @brief 交还上一个文件字段的内容流，之后才能读取下一个字段
     */
    virtual void reclaim(std::unique_ptr<FieldBody> body) = 0;
};

} // namespace source
} // namespace formsave
