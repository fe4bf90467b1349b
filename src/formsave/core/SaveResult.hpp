#pragma once

#include "formsave/core/ErrorCode.hpp"
#include "formsave/core/Expected.hpp"
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace formsave {
namespace core {

/**
 * @brief 保存操作中途停止的原因
 *
 * CountLimit / SizeLimit 是配置带来的预期截断，IoError 是意外失败。
 */
class PartialReason {
public:
    enum class Kind : uint8_t {
        CountLimit,  // 字段数量达到上限，当前字段完全未读
        SizeLimit,   // 单个字段达到大小上限，已写入的部分保留
        IoError      // 读写过程中出错
    };

    static PartialReason countLimit() { return PartialReason(Kind::CountLimit); }
    static PartialReason sizeLimit() { return PartialReason(Kind::SizeLimit); }
    static PartialReason ioError(Error error) { return PartialReason(std::move(error)); }

    explicit PartialReason(Error error) : kind_(Kind::IoError), error_(std::move(error)) {}

    Kind kind() const noexcept { return kind_; }
    bool isCountLimit() const noexcept { return kind_ == Kind::CountLimit; }
    bool isSizeLimit() const noexcept { return kind_ == Kind::SizeLimit; }
    bool isIoError() const noexcept { return kind_ == Kind::IoError; }

    /**
     * @brief IoError 时返回底层错误，否则返回 nullptr
     */
    const Error* error() const noexcept { return error_ ? &*error_ : nullptr; }

    /**
     * @brief 取出 IoError 的底层错误
     * @throws FormSaveException 原因不是 IoError（调用方的不变式被破坏）
     */
    Error unwrapError() && {
        return std::move(*this).expectError("PartialReason was not IoError");
    }

    Error expectError(const std::string& msg) &&;

    std::string describe() const;

private:
    explicit PartialReason(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::optional<Error> error_;
};

/**
 * @brief 三态保存结果：Full / Partial / Error
 *
 * - Full(S)：操作完整结束
 * - Partial(P, reason)：中途停止，携带已经产生的部分结果
 * - Error(e)：一开始就失败，没有任何进度
 *
 * Partial 转换为 S 使用 static_cast<S>(P&&)，S 与 P 相同时即为恒等。
 */
template<typename S, typename P>
class SaveResult {
public:
    using full_type = S;
    using partial_type = P;

private:
    struct FullValue {
        S value;
    };
    struct PartialValue {
        P value;
        PartialReason reason;
    };

    std::variant<FullValue, PartialValue, Error> storage_;

    explicit SaveResult(FullValue&& v) : storage_(std::move(v)) {}
    explicit SaveResult(PartialValue&& v) : storage_(std::move(v)) {}
    explicit SaveResult(Error&& e) : storage_(std::move(e)) {}

    static S partialToFull(P&& p) {
        if constexpr (std::is_same_v<S, P>) {
            return std::move(p);
        } else {
            return static_cast<S>(std::move(p));
        }
    }

public:
    // ========== 构造 ==========

    static SaveResult full(S value) {
        return SaveResult(FullValue{std::move(value)});
    }

    static SaveResult partial(P value, PartialReason reason) {
        return SaveResult(PartialValue{std::move(value), std::move(reason)});
    }

    static SaveResult error(Error error) {
        return SaveResult(std::move(error));
    }

    // ========== 状态检查 ==========

    bool isFull() const noexcept { return storage_.index() == 0; }
    bool isPartial() const noexcept { return storage_.index() == 1; }
    bool isError() const noexcept { return storage_.index() == 2; }

    // ========== 访问（调用前先检查状态） ==========

    S& fullValue() & { return std::get<FullValue>(storage_).value; }
    const S& fullValue() const & { return std::get<FullValue>(storage_).value; }
    S&& fullValue() && { return std::move(std::get<FullValue>(storage_).value); }

    P& partialValue() & { return std::get<PartialValue>(storage_).value; }
    const P& partialValue() const & { return std::get<PartialValue>(storage_).value; }
    P&& partialValue() && { return std::move(std::get<PartialValue>(storage_).value); }

    const PartialReason& reason() const & { return std::get<PartialValue>(storage_).reason; }
    PartialReason&& reason() && { return std::move(std::get<PartialValue>(storage_).reason); }

    const Error& errorValue() const & { return std::get<Error>(storage_); }
    Error&& errorValue() && { return std::move(std::get<Error>(storage_)); }

    // ========== 组合子 ==========

    /**
     * @brief 对 Full / Partial 的值做同一映射，Partial 保留原因
     */
    template<typename F>
    auto map(F&& func) && -> SaveResult<std::invoke_result_t<F, S&&>, std::invoke_result_t<F, S&&>> {
        using T = std::invoke_result_t<F, S&&>;
        using Out = SaveResult<T, T>;
        if (isFull()) {
            return Out::full(std::forward<F>(func)(std::move(*this).fullValue()));
        }
        if (isPartial()) {
            auto& pv = std::get<PartialValue>(storage_);
            return Out::partial(std::forward<F>(func)(partialToFull(std::move(pv.value))),
                                std::move(pv.reason));
        }
        return Out::error(std::move(*this).errorValue());
    }

    /**
     * @brief 乐观转换：Partial 视为成功并丢弃原因
     */
    Result<S> intoResult() && {
        if (isFull()) {
            return Result<S>(std::move(*this).fullValue());
        }
        if (isPartial()) {
            return Result<S>(partialToFull(std::move(*this).partialValue()));
        }
        return Result<S>(std::move(*this).errorValue());
    }

    /**
     * @brief 严格转换：只有 IoError 原因的 Partial 视为失败
     *
     * 注意：Partial 时磁盘上可能残留写了一半的文件。
     */
    Result<S> intoResultStrict() && {
        if (isPartial() && reason().isIoError()) {
            return Result<S>(std::move(std::get<PartialValue>(storage_).reason).unwrapError());
        }
        return std::move(*this).intoResult();
    }

    /**
     * @brief 分解为 (尽力而为的结果, 底层错误)
     */
    std::pair<std::optional<S>, std::optional<Error>> intoOptBoth() && {
        if (isFull()) {
            return {std::optional<S>(std::move(*this).fullValue()), std::nullopt};
        }
        if (isPartial()) {
            auto& pv = std::get<PartialValue>(storage_);
            std::optional<Error> err;
            if (pv.reason.isIoError()) {
                err = std::move(pv.reason).unwrapError();
            }
            return {std::optional<S>(partialToFull(std::move(pv.value))), std::move(err)};
        }
        return {std::nullopt, std::optional<Error>(std::move(*this).errorValue())};
    }

    /**
     * @brief 只取结果部分；仍可能发生过错误
     */
    std::optional<S> okish() && {
        return std::move(*this).intoOptBoth().first;
    }
};

} // namespace core
} // namespace formsave
