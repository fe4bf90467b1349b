#include "formsave/core/SaveResult.hpp"
#include "formsave/core/Exception.hpp"
#include <gtest/gtest.h>
#include <cerrno>
#include <string>

namespace formsave {
namespace core {

namespace {

using IntResult = SaveResult<int, int>;

// Partial 类型与 Full 类型不同时，通过显式转换折叠
struct Draft {
    std::string text;
    explicit operator std::string() && { return text + "..."; }
};

using DraftResult = SaveResult<std::string, Draft>;

} // namespace

TEST(PartialReasonTest, KindsAndDescription) {
    EXPECT_TRUE(PartialReason::countLimit().isCountLimit());
    EXPECT_TRUE(PartialReason::sizeLimit().isSizeLimit());

    auto io = PartialReason::ioError(makeError(ErrorCode::NoSpace, "disk full"));
    EXPECT_TRUE(io.isIoError());
    ASSERT_NE(io.error(), nullptr);
    EXPECT_EQ(io.error()->code, ErrorCode::NoSpace);
    EXPECT_NE(io.describe().find("disk full"), std::string::npos);

    EXPECT_EQ(PartialReason::sizeLimit().error(), nullptr);
}

TEST(PartialReasonTest, UnwrapErrorOnLimitThrows) {
    EXPECT_THROW(PartialReason::countLimit().unwrapError(), FormSaveException);
    EXPECT_THROW(PartialReason::sizeLimit().expectError("field had no error"), FormSaveException);

    Error err = PartialReason::ioError(Error(ErrorCode::WriteZero)).unwrapError();
    EXPECT_EQ(err.code, ErrorCode::WriteZero);
}

TEST(SaveResultTest, ExactlyOneTag) {
    auto full = IntResult::full(1);
    EXPECT_TRUE(full.isFull());
    EXPECT_FALSE(full.isPartial());
    EXPECT_FALSE(full.isError());

    auto partial = IntResult::partial(2, PartialReason::sizeLimit());
    EXPECT_TRUE(partial.isPartial());
    EXPECT_EQ(partial.partialValue(), 2);
    EXPECT_TRUE(partial.reason().isSizeLimit());

    auto error = IntResult::error(Error(ErrorCode::FileNotFound));
    EXPECT_TRUE(error.isError());
    EXPECT_EQ(error.errorValue().code, ErrorCode::FileNotFound);
}

TEST(SaveResultTest, MapKeepsReason) {
    auto doubled = IntResult::partial(21, PartialReason::countLimit()).map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.isPartial());
    EXPECT_EQ(doubled.partialValue(), 42);
    EXPECT_TRUE(doubled.reason().isCountLimit());

    auto full = IntResult::full(5).map([](int v) { return std::to_string(v); });
    ASSERT_TRUE(full.isFull());
    EXPECT_EQ(full.fullValue(), "5");

    auto err = IntResult::error(Error(ErrorCode::NoSpace)).map([](int v) { return v + 1; });
    ASSERT_TRUE(err.isError());
    EXPECT_EQ(err.errorValue().code, ErrorCode::NoSpace);
}

TEST(SaveResultTest, MapConvertsPartialPayload) {
    auto mapped = DraftResult::partial(Draft{"abc"}, PartialReason::sizeLimit())
                      .map([](std::string s) { return s.size(); });
    ASSERT_TRUE(mapped.isPartial());
    EXPECT_EQ(mapped.partialValue(), 6u);
}

TEST(SaveResultTest, IntoResultIsOptimistic) {
    auto partial = IntResult::partial(7, PartialReason::ioError(Error(ErrorCode::NoSpace))).intoResult();
    ASSERT_TRUE(partial.hasValue());
    EXPECT_EQ(*partial, 7);

    auto error = IntResult::error(Error(ErrorCode::FileExists)).intoResult();
    ASSERT_TRUE(error.hasError());
    EXPECT_EQ(error.error().code, ErrorCode::FileExists);
}

TEST(SaveResultTest, IntoResultStrictOnlyFailsOnIoError) {
    auto limited = IntResult::partial(3, PartialReason::sizeLimit()).intoResultStrict();
    ASSERT_TRUE(limited.hasValue());
    EXPECT_EQ(*limited, 3);

    auto failed = IntResult::partial(3, PartialReason::ioError(Error(ErrorCode::NoSpace))).intoResultStrict();
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code, ErrorCode::NoSpace);

    auto converted = DraftResult::partial(Draft{"x"}, PartialReason::countLimit()).intoResultStrict();
    ASSERT_TRUE(converted.hasValue());
    EXPECT_EQ(*converted, "x...");
}

TEST(SaveResultTest, IntoOptBoth) {
    auto [full_value, full_err] = IntResult::full(1).intoOptBoth();
    ASSERT_TRUE(full_value.has_value());
    EXPECT_EQ(*full_value, 1);
    EXPECT_FALSE(full_err.has_value());

    auto [limit_value, limit_err] = IntResult::partial(2, PartialReason::countLimit()).intoOptBoth();
    ASSERT_TRUE(limit_value.has_value());
    EXPECT_EQ(*limit_value, 2);
    EXPECT_FALSE(limit_err.has_value());

    auto [io_value, io_err] =
        IntResult::partial(3, PartialReason::ioError(Error(ErrorCode::StreamReadError))).intoOptBoth();
    ASSERT_TRUE(io_value.has_value());
    EXPECT_EQ(*io_value, 3);
    ASSERT_TRUE(io_err.has_value());
    EXPECT_EQ(io_err->code, ErrorCode::StreamReadError);

    auto [err_value, err_err] = IntResult::error(Error(ErrorCode::FileNotFound)).intoOptBoth();
    EXPECT_FALSE(err_value.has_value());
    ASSERT_TRUE(err_err.has_value());
    EXPECT_EQ(err_err->code, ErrorCode::FileNotFound);

    auto okish = IntResult::partial(4, PartialReason::sizeLimit()).okish();
    ASSERT_TRUE(okish.has_value());
    EXPECT_EQ(*okish, 4);
}

TEST(ExpectedTest, ValueOrThrowRaisesFormSaveException) {
    Result<int> ok(5);
    EXPECT_EQ(std::move(ok).valueOrThrow(), 5);

    Result<int> bad(makeError(ErrorCode::FileNotFound, "missing", "/tmp/x"));
    try {
        std::move(bad).valueOrThrow();
        FAIL() << "expected FormSaveException";
    } catch (const FormSaveException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::FileNotFound);
        ASSERT_EQ(e.getContext().size(), 1u);
        EXPECT_EQ(e.getContext()[0], "/tmp/x");
        EXPECT_NE(e.getDetailedMessage().find("File not found"), std::string::npos);
    }
}

TEST(ExpectedTest, Combinators) {
    auto parsed = Result<int>(20).map([](int v) { return v + 1; }).andThen([](int v) {
        return v % 2 == 1 ? Result<std::string>(std::to_string(v))
                          : Result<std::string>(makeError(ErrorCode::InvalidArgument, "even"));
    });
    ASSERT_TRUE(parsed.hasValue());
    EXPECT_EQ(*parsed, "21");

    auto failed = Result<int>(makeError(ErrorCode::FileReadError, "io")).map([](int v) { return v * 2; });
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.valueOr(-1), -1);

    auto renamed = std::move(failed).mapError([](Error e) {
        e.context = "renamed";
        return e;
    });
    EXPECT_EQ(renamed.error().context, "renamed");
}

TEST(ErrorCodeTest, ErrnoMapping) {
    EXPECT_EQ(errnoToCode(EINTR, ErrorCode::FileWriteError), ErrorCode::Interrupted);
    EXPECT_EQ(errnoToCode(EEXIST, ErrorCode::FileWriteError), ErrorCode::FileExists);
    EXPECT_EQ(errnoToCode(EIO, ErrorCode::FileWriteError), ErrorCode::FileWriteError);

    Error err = errorFromErrno(ENOENT, ErrorCode::FileOpenError, "open failed", "/nope");
    EXPECT_EQ(err.code, ErrorCode::FileNotFound);
    ASSERT_TRUE(err.native_code.has_value());
    EXPECT_EQ(*err.native_code, ENOENT);
    EXPECT_NE(err.fullMessage().find("/nope"), std::string::npos);
}

} // namespace core
} // namespace formsave
