#include "formsave/core/SavedData.hpp"
#include "formsave/io/FileReader.hpp"
#include "formsave/io/MemoryReader.hpp"
#include <limits>
#include <memory>

namespace formsave {
namespace core {

uint64_t SavedData::size() const noexcept {
    if (auto* t = std::get_if<Text>(&storage_)) {
        return t->value.size();
    }
    if (auto* b = std::get_if<Bytes>(&storage_)) {
        return b->value.size();
    }
    return std::get<File>(storage_).size;
}

Result<std::unique_ptr<io::IBufferedReader>> SavedData::readable() const {
    using ReaderPtr = std::unique_ptr<io::IBufferedReader>;

    if (auto* t = std::get_if<Text>(&storage_)) {
        return ReaderPtr(std::make_unique<io::MemoryReader>(t->value));
    }
    if (auto* b = std::get_if<Bytes>(&storage_)) {
        return ReaderPtr(std::make_unique<io::MemoryReader>(b->value));
    }

    auto reader = io::FileReader::open(std::get<File>(storage_).path.string());
    if (!reader) {
        return std::move(reader).error();
    }
    return ReaderPtr(std::move(reader).value());
}

void SavedData::addSize(uint64_t amount) noexcept {
    if (auto* f = std::get_if<File>(&storage_)) {
        const uint64_t max = std::numeric_limits<uint64_t>::max();
        f->size = (max - f->size < amount) ? max : f->size + amount;
    }
}

} // namespace core
} // namespace formsave
