/**
 * @file operation_result.hpp
 * @brief Outcome envelope for service layers built on fieldkit
 *
 * An OperationResult is either a success, optionally carrying a payload and a
 * total count for paged results, or a failure carrying at least one error
 * message. A success never carries errors and a failure never carries a
 * payload. The factories are the only way to build one, so this always holds.
 *
 * @code
 * OperationResult<Record<User>> findUser(std::int64_t id)
 * {
 *     if (auto it = users.find(id); it != users.end())
 *         return OperationResult<Record<User>>::success(it->second);
 *
 *     return OperationResult<Record<User>>::failure(std::format("no user with id {}", id));
 * }
 * @endcode
 */

#pragma once

#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace fieldkit
{

template <typename T>
class OperationResult
{
public:
    using Errors = std::vector<std::string>;

    static OperationResult success(T payload, std::size_t totalCount = 0)
    {
        return OperationResult(std::optional<T>(std::move(payload)), totalCount);
    }

    /// A success without payload
    static OperationResult success()
    {
        return OperationResult(std::optional<T>(), 0);
    }

    static OperationResult failure(std::string message)
    {
        return failure(Errors { std::move(message) });
    }

    /// A failure with the given messages. An empty list is replaced by a generic message.
    static OperationResult failure(Errors messages)
    {
        if (messages.empty())
            messages.emplace_back("unspecified error");

        return OperationResult(std::unexpected(std::move(messages)));
    }

    bool isSuccess() const { return outcome.has_value(); }
    explicit operator bool() const { return isSuccess(); }

    /// The payload of a success, empty for a failure and for a success without payload
    std::optional<T> const& payload() const
    {
        static std::optional<T> const kNone;
        return outcome ? *outcome : kNone;
    }

    /// The error messages of a failure, empty for a success
    Errors const& errors() const
    {
        static Errors const kNone;
        return outcome ? kNone : outcome.error();
    }

    std::size_t totalCount() const { return count; }

    /**
     * @brief Map the payload of a success
     *
     * A failure is forwarded with its errors, a success without payload stays
     * one. The total count is kept.
     */
    template <typename Fn>
    auto transform(Fn && fn) const -> OperationResult<std::invoke_result_t<Fn, T const&>>
    {
        using U = std::invoke_result_t<Fn, T const&>;

        if (! outcome)
            return OperationResult<U>::failure(outcome.error());

        if (! outcome->has_value())
            return OperationResult<U>::success();

        return OperationResult<U>::success(std::invoke(std::forward<Fn>(fn), **outcome), count);
    }

private:
    using Outcome = std::expected<std::optional<T>, Errors>;

    OperationResult(std::optional<T> payload_, std::size_t totalCount)
        : outcome(std::move(payload_)), count(totalCount) {}

    OperationResult(std::unexpected<Errors> errors_)
        : outcome(std::move(errors_)) {}

    Outcome outcome;
    std::size_t count = 0;
};

/// Outcome of an operation without payload
template <>
class OperationResult<void>
{
public:
    using Errors = std::vector<std::string>;

    static OperationResult success()
    {
        return OperationResult(Outcome());
    }

    static OperationResult failure(std::string message)
    {
        return failure(Errors { std::move(message) });
    }

    static OperationResult failure(Errors messages)
    {
        if (messages.empty())
            messages.emplace_back("unspecified error");

        return OperationResult(std::unexpected(std::move(messages)));
    }

    bool isSuccess() const { return outcome.has_value(); }
    explicit operator bool() const { return isSuccess(); }

    Errors const& errors() const
    {
        static Errors const kNone;
        return outcome ? kNone : outcome.error();
    }

private:
    using Outcome = std::expected<void, Errors>;

    explicit OperationResult(Outcome outcome_) : outcome(std::move(outcome_)) {}

    Outcome outcome;
};

/// Prints "success" or "failure: " followed by the error messages
template <typename T>
std::ostream& operator<<(std::ostream& o, OperationResult<T> const& result)
{
    if (result)
        return o << "success";

    o << "failure: ";
    auto first = true;

    for (auto const& error : result.errors())
    {
        if (! std::exchange(first, false))
            o << "; ";

        o << error;
    }

    return o;
}

} // namespace fieldkit
