#include "formsave/core/RequestSaver.hpp"
#include "formsave/core/FieldSaver.hpp"
#include "formsave/utils/ModuleLoggers.hpp"
#include <system_error>

namespace formsave {
namespace core {

namespace fs = std::filesystem;

Result<Entries> intoEntries(EntriesSaveResult result) {
    if (result.isFull()) {
        return Result<Entries>(std::move(result).fullValue());
    }
    if (result.isError()) {
        return Result<Entries>(std::move(result).errorValue());
    }
    if (result.reason().isIoError()) {
        SAVE_WARN("discarding partial field after error: {}", result.reason().describe());
    }
    return Result<Entries>(static_cast<Entries>(std::move(result).partialValue()));
}

EntriesSaveResult RequestSaver::tempWithPrefix(const std::string& prefix) {
    auto dir = SaveDirectory::createTemp(prefix);
    if (!dir) {
        SAVE_ERROR("failed to create temp save directory: {}", dir.error().fullMessage());
        return EntriesSaveResult::error(std::move(dir).error());
    }
    return withTempDir(std::move(dir).value());
}

EntriesSaveResult RequestSaver::withTempDir(SaveDirectory dir) {
    return withEntries(Entries(std::move(dir)));
}

EntriesSaveResult RequestSaver::withDir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        SAVE_ERROR("failed to create save directory {}: {}", dir.string(), ec.message());
        return EntriesSaveResult::error(errorFromErrno(ec.value(), ErrorCode::DirectoryCreateError,
                                                       "failed to create save directory", dir.string()));
    }
    return withEntries(Entries(SaveDirectory::permanent(dir)));
}

EntriesSaveResult RequestSaver::withEntries(Entries entries) {
    uint32_t saved_count = 0;

    for (;;) {
        auto next = source_.readField();

        if (next.isEnd()) {
            SAVE_DEBUG("request saved: {} records, {} file fields in this pass",
                       entries.fieldCount(), saved_count);
            return EntriesSaveResult::full(std::move(entries));
        }

        if (next.isError()) {
            SAVE_WARN("field source failed: {}", next.error().fullMessage());
            return EntriesSaveResult::partial(PartialEntries(std::move(entries)),
                                              PartialReason::ioError(next.takeError()));
        }

        source::MultipartField& field = next.field();

        if (auto* text = std::get_if<source::MultipartField::Text>(&field.data)) {
            entries.fieldsFor(field.name).emplace_back(std::move(field.headers),
                                                       SavedData::text(std::move(text->value)));
            continue;
        }

        auto& body = std::get<source::MultipartField::File>(field.data).body;

        if (options_.count_limit && saved_count >= *options_.count_limit) {
            SAVE_INFO("count limit of {} reached, field '{}' left unread", *options_.count_limit, field.name);
            PartialSavedField partial{field.name, std::move(field.headers), std::move(body), std::nullopt};
            return EntriesSaveResult::partial(PartialEntries(std::move(entries), std::move(partial)),
                                              PartialReason::countLimit());
        }
        ++saved_count;

        FieldSaver saver(*body, options_);
        auto res = saver.withDir(entries.save_dir.path());

        if (res.isFull()) {
            source_.reclaim(std::move(body));
            entries.fieldsFor(field.name).emplace_back(std::move(field.headers), std::move(res).fullValue());
            continue;
        }

        if (res.isPartial()) {
            SAVE_WARN("field '{}' saved partially: {}", field.name, res.reason().describe());
            PartialReason reason = std::move(res).reason();
            SavedField dest(field.headers, std::move(res).partialValue());
            PartialSavedField partial{field.name, std::move(field.headers), std::move(body), std::move(dest)};
            return EntriesSaveResult::partial(PartialEntries(std::move(entries), std::move(partial)),
                                              std::move(reason));
        }

        SAVE_WARN("field '{}' could not be saved: {}", field.name, res.errorValue().fullMessage());
        PartialSavedField partial{field.name, std::move(field.headers), std::move(body), std::nullopt};
        return EntriesSaveResult::partial(PartialEntries(std::move(entries), std::move(partial)),
                                          PartialReason::ioError(std::move(res).errorValue()));
    }
}

} // namespace core
} // namespace formsave
