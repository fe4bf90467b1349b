#include "formsave/core/Entries.hpp"
#include "formsave/source/MemoryFieldSource.hpp"
#include "formsave/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace formsave {
namespace core {


class EntriesTest : public ::testing::Test {
protected:
    void SetUp() override {
        formsave::Logger::getInstance().initialize("logs/Entries_test.log",
                                                   formsave::Logger::Level::DEBUG,
                                                   false);
    }

    void TearDown() override {
        formsave::Logger::getInstance().shutdown();
    }

    static Entries makeEntries() {
        return Entries(SaveDirectory::permanent("entries_unused"));
    }

    // 辅助函数：从内存来源取出一个文件字段的 body
    static std::unique_ptr<source::FieldBody> takeBody(source::MemoryFieldSource& src) {
        auto next = src.readField();
        return std::move(std::get<source::MultipartField::File>(next.field().data).body);
    }
};

TEST_F(EntriesTest, GroupsByNameInOrder) {
    Entries entries = makeEntries();
    EXPECT_TRUE(entries.isEmpty());

    entries.addField(SavedField(FieldHeaders("tag"), SavedData::text("a")));
    entries.addField(SavedField(FieldHeaders("other"), SavedData::text("x")));
    entries.addField(SavedField(FieldHeaders("tag"), SavedData::text("b")));

    EXPECT_FALSE(entries.isEmpty());
    EXPECT_EQ(entries.fieldCount(), 3u);
    ASSERT_EQ(entries.fields["tag"].size(), 2u);
    EXPECT_EQ(entries.fields["tag"][0].data.asText(), "a");
    EXPECT_EQ(entries.fields["tag"][1].data.asText(), "b");
}

TEST_F(EntriesTest, SavedDataSizes) {
    EXPECT_EQ(SavedData::text("hello").size(), 5u);
    EXPECT_EQ(SavedData::bytes({1, 2, 3}).size(), 3u);

    SavedData file = SavedData::file("p", 10);
    file.addSize(5);
    EXPECT_EQ(file.size(), 15u);
    file.addSize(std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(file.size(), std::numeric_limits<uint64_t>::max());

    SavedData text = SavedData::text("abc");
    text.addSize(100);
    EXPECT_EQ(text.size(), 3u);
}

TEST_F(EntriesTest, KeepPartialPromotesWrittenBytes) {
    PartialSavedField partial{"upload", FieldHeaders("upload", std::string("a.bin")), nullptr,
                              SavedField(FieldHeaders("upload"), SavedData::file("some/path", 42))};
    PartialEntries pe(makeEntries(), std::move(partial));

    Entries entries = std::move(pe).keepPartial();
    ASSERT_EQ(entries.fields.count("upload"), 1u);
    EXPECT_EQ(entries.fields["upload"][0].data.size(), 42u);
}

TEST_F(EntriesTest, KeepPartialDiscardsEmptyDestination) {
    PartialSavedField no_dest{"a", FieldHeaders("a"), nullptr, std::nullopt};
    Entries first = PartialEntries(makeEntries(), std::move(no_dest)).keepPartial();
    EXPECT_TRUE(first.isEmpty());

    PartialSavedField empty_dest{"b", FieldHeaders("b"), nullptr,
                                 SavedField(FieldHeaders("b"), SavedData::file("p", 0))};
    Entries second = PartialEntries(makeEntries(), std::move(empty_dest)).keepPartial();
    EXPECT_TRUE(second.isEmpty());
}

TEST_F(EntriesTest, ConversionDropsPartialField) {
    PartialSavedField partial{"x", FieldHeaders("x"), nullptr,
                              SavedField(FieldHeaders("x"), SavedData::bytes({1, 2, 3}))};
    PartialEntries pe(makeEntries(), std::move(partial));
    pe.entries.addField(SavedField(FieldHeaders("y"), SavedData::text("kept")));

    Entries entries = static_cast<Entries>(std::move(pe));
    EXPECT_EQ(entries.fieldCount(), 1u);
    EXPECT_EQ(entries.fields.count("x"), 0u);
}

TEST_F(EntriesTest, CallerChoosesWhatToDoWithCutOffBody) {
    source::MemoryFieldSource src;
    src.addFile("big", std::string("0123456789"));

    PartialSavedField partial{"big", FieldHeaders("big"), takeBody(src), std::nullopt};

    auto first = partial.body->fillBuffer();
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ(first->size(), 10u);

    auto drained = partial.drainBody();
    ASSERT_TRUE(drained.hasValue());
    EXPECT_EQ(*drained, 10u);

    EXPECT_TRUE(src.hasOutstandingBody());
    src.reclaim(partial.takeBody());
    EXPECT_FALSE(src.hasOutstandingBody());
    EXPECT_FALSE(partial.body);
}

} // namespace core
} // namespace formsave
