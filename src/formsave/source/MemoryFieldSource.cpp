#include "formsave/source/MemoryFieldSource.hpp"
#include "formsave/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace formsave {
namespace source {

namespace {

// 拥有内容的字段流
class MemoryFieldBody : public FieldBody {
public:
    MemoryFieldBody(std::string name, std::vector<uint8_t> content, size_t chunk_size)
        : name_(std::move(name)), content_(std::move(content)), chunk_size_(chunk_size) {}

    core::Result<core::ByteView> fillBuffer() override {
        core::ByteView rest = core::ByteView(content_.data(), content_.size()).subspan(pos_);
        return chunk_size_ == 0 ? rest : rest.first(chunk_size_);
    }

    void consume(size_t amount) override {
        pos_ = std::min(pos_ + amount, content_.size());
    }

    const std::string& fieldName() const override { return name_; }

private:
    std::string name_;
    std::vector<uint8_t> content_;
    size_t chunk_size_;
    size_t pos_ = 0;
};

} // namespace

MemoryFieldSource& MemoryFieldSource::addText(const std::string& name, std::string value) {
    Pending p;
    p.headers = core::FieldHeaders(name);
    p.text = std::move(value);
    pending_.push_back(std::move(p));
    return *this;
}

MemoryFieldSource& MemoryFieldSource::addFile(const std::string& name, std::vector<uint8_t> content,
                                              std::optional<std::string> filename,
                                              std::optional<std::string> content_type) {
    Pending p;
    p.headers = core::FieldHeaders(name, std::move(filename), std::move(content_type));
    p.content = std::move(content);
    pending_.push_back(std::move(p));
    return *this;
}

MemoryFieldSource& MemoryFieldSource::addFile(const std::string& name, const std::string& content,
                                              std::optional<std::string> filename,
                                              std::optional<std::string> content_type) {
    return addFile(name, std::vector<uint8_t>(content.begin(), content.end()),
                   std::move(filename), std::move(content_type));
}

MemoryFieldSource& MemoryFieldSource::addError(core::Error error) {
    Pending p;
    p.error = std::move(error);
    pending_.push_back(std::move(p));
    return *this;
}

FieldReadResult MemoryFieldSource::readField() {
    if (outstanding_) {
        SRC_WARN("readField() called before the previous body was reclaimed");
        return FieldReadResult::error(core::makeError(core::ErrorCode::InvalidState,
                                                      "previous field body was not reclaimed"));
    }
    if (pending_.empty()) {
        return FieldReadResult::end();
    }

    Pending next = std::move(pending_.front());
    pending_.pop_front();

    if (next.error) {
        return FieldReadResult::error(std::move(*next.error));
    }

    MultipartField field;
    field.name = next.headers.name;
    field.headers = std::move(next.headers);
    if (next.text) {
        field.data = MultipartField::Text{std::move(*next.text)};
    } else {
        SRC_DEBUG("yielding file field '{}' ({} bytes)", field.name, next.content.size());
        field.data = MultipartField::File{
            std::make_unique<MemoryFieldBody>(field.name, std::move(next.content), chunk_size_)};
        outstanding_ = true;
    }
    return FieldReadResult::field(std::move(field));
}

void MemoryFieldSource::reclaim(std::unique_ptr<FieldBody> body) {
    if (body) {
        SRC_DEBUG("body of field '{}' reclaimed", body->fieldName());
    }
    outstanding_ = false;
}

} // namespace source
} // namespace formsave
