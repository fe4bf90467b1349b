#include "formsave/core/Entries.hpp"
#include "formsave/io/StreamCopier.hpp"
#include "formsave/utils/ModuleLoggers.hpp"

namespace formsave {
namespace core {

namespace {

// 丢弃写入的所有数据
class NullWriter : public io::IWriter {
public:
    Result<size_t> write(const uint8_t*, size_t size) override { return size; }
    const char* getTypeName() const override { return "NullWriter"; }
};

} // namespace

size_t Entries::fieldCount() const noexcept {
    size_t count = 0;
    for (const auto& kv : fields) {
        count += kv.second.size();
    }
    return count;
}

Result<uint64_t> PartialSavedField::copyBodyTo(io::IWriter& writer) {
    if (!body) {
        return uint64_t(0);
    }
    return io::StreamCopier::tryCopyBuffered(*body, writer).intoResultStrict();
}

Result<uint64_t> PartialSavedField::drainBody() {
    NullWriter sink;
    auto drained = copyBodyTo(sink);
    if (drained) {
        SAVE_DEBUG("drained {} bytes from field '{}'", *drained, field_name);
    }
    return drained;
}

Entries PartialEntries::keepPartial() && {
    if (partial && partial->dest && partial->dest->data.size() > 0) {
        SAVE_DEBUG("keeping partially saved field '{}' ({} bytes)", partial->field_name,
                   partial->dest->data.size());
        entries.fieldsFor(partial->field_name).push_back(std::move(*partial->dest));
    }
    partial.reset();
    return std::move(entries);
}

} // namespace core
} // namespace formsave
