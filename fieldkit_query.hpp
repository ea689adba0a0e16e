/**
 * @file fieldkit_query.hpp
 * @brief Field name driven queries over collections of records
 *
 * Every query takes the field name at runtime and reads it with getField().
 * If the record type has no readable field with that name, sorting and
 * filtering return the input unchanged and aggregates return 0.
 *
 * @code
 * std::vector<Record<User>> users = ...;
 * auto active = whereFieldEquals(users, "IsActive", true);
 * auto sorted = orderByField(active, "Name");
 * auto first  = page(sorted, 1, 20);
 * @endcode
 */

#pragma once

#include <cctype>
#include <iterator>
#include "fieldkit_access.hpp"

namespace fieldkit
{

enum class SortOrder
{
    ascending,
    descending
};

namespace detail
{
template <typename R>
bool hasReadableField(std::string_view name)
{
    auto const* descriptor = R::meta().field(name);
    return descriptor != nullptr && descriptor->isReadable();
}

inline bool containsIgnoreCase(std::string_view haystack, std::string_view needle)
{
    auto const it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [] (char a, char b)
    {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });

    return it != haystack.end() || needle.empty();
}
} // namespace detail

/**
 * @brief Stable sort by the named field
 *
 * Records as field values are unordered among each other and keep their
 * relative order.
 */
template <typename R>
std::vector<R> orderByField(std::vector<R> const& records, std::string_view name, SortOrder order = SortOrder::ascending)
{
    auto result = records;

    if (! detail::hasReadableField<R>(name))
        return result;

    std::stable_sort(result.begin(), result.end(), [name, order] (R const& a, R const& b)
    {
        auto const ordering = compare(getField(a, name), getField(b, name));
        return order == SortOrder::ascending ? ordering < 0 : ordering > 0;
    });

    return result;
}

/// Keeps the records whose field compares equivalent to value
template <typename R>
std::vector<R> whereFieldEquals(std::vector<R> const& records, std::string_view name, Variant const& value)
{
    if (! detail::hasReadableField<R>(name))
        return records;

    std::vector<R> result;
    std::copy_if(records.begin(), records.end(), std::back_inserter(result), [name, &value] (R const& record)
    {
        return std::is_eq(compare(getField(record, name), value));
    });

    return result;
}

/**
 * @brief Keeps the records whose field contains needle
 *
 * The field is rendered with Variant::toString() and searched without regard
 * to case. Null fields never match.
 */
template <typename R>
std::vector<R> whereFieldContains(std::vector<R> const& records, std::string_view name, std::string_view needle)
{
    if (! detail::hasReadableField<R>(name))
        return records;

    std::vector<R> result;
    std::copy_if(records.begin(), records.end(), std::back_inserter(result), [name, needle] (R const& record)
    {
        auto const value = getField(record, name);

        if (value.isNull())
            return false;

        auto const rendered = value.toString();
        return ! rendered.empty() && detail::containsIgnoreCase(rendered, needle);
    });

    return result;
}

/// Groups by field value, groups and their members in order of first appearance
template <typename R>
std::vector<std::pair<Variant, std::vector<R>>> groupByField(std::vector<R> const& records, std::string_view name)
{
    std::vector<std::pair<Variant, std::vector<R>>> groups;
    auto const known = detail::hasReadableField<R>(name);

    for (auto const& record : records)
    {
        auto key = known ? getField(record, name) : Variant();
        auto it = std::find_if(groups.begin(), groups.end(), [&key] (auto const& group) { return group.first == key; });

        if (it == groups.end())
        {
            groups.emplace_back(std::move(key), std::vector<R>());
            it = std::prev(groups.end());
        }

        it->second.push_back(record);
    }

    return groups;
}

/// Keeps the first record of each distinct field value
template <typename R>
std::vector<R> distinctByField(std::vector<R> const& records, std::string_view name)
{
    if (! detail::hasReadableField<R>(name))
        return records;

    std::vector<R> result;
    for (auto& group : groupByField(records, name))
        result.push_back(std::move(group.second.front()));

    return result;
}

/// Sum of the field coerced to double, values that cannot be coerced count as 0
template <typename R>
double sumByField(std::vector<R> const& records, std::string_view name)
{
    if (! detail::hasReadableField<R>(name))
        return 0.0;

    auto sum = 0.0;
    for (auto const& record : records)
        sum += getField<double>(record, name);

    return sum;
}

template <typename R>
double averageByField(std::vector<R> const& records, std::string_view name)
{
    if (records.empty())
        return 0.0;

    return sumByField(records, name) / static_cast<double>(records.size());
}

/// First record with the smallest field value, or the first record if the field is unknown
template <typename R>
std::optional<R> minByField(std::vector<R> const& records, std::string_view name)
{
    auto const ordered = orderByField(records, name, SortOrder::ascending);

    if (ordered.empty())
        return std::nullopt;

    return ordered.front();
}

/// First record with the largest field value, or the first record if the field is unknown
template <typename R>
std::optional<R> maxByField(std::vector<R> const& records, std::string_view name)
{
    auto const ordered = orderByField(records, name, SortOrder::descending);

    if (ordered.empty())
        return std::nullopt;

    return ordered.front();
}

/**
 * @brief Returns page pageNumber (1-based) of pageSize records
 *
 * A page number below 1 selects the first page, a page size below 1 means 10.
 */
template <typename R>
std::vector<R> page(std::vector<R> const& records, int pageNumber, int pageSize)
{
    if (pageNumber < 1)
        pageNumber = 1;

    if (pageSize < 1)
        pageSize = 10;

    auto const first = static_cast<std::size_t>(pageNumber - 1) * static_cast<std::size_t>(pageSize);

    if (first >= records.size())
        return {};

    auto const last = std::min(records.size(), first + static_cast<std::size_t>(pageSize));
    return std::vector<R>(records.begin() + static_cast<std::ptrdiff_t>(first), records.begin() + static_cast<std::ptrdiff_t>(last));
}

/// Number of pages needed for count records, a page size below 1 means 10
inline std::size_t totalPages(std::size_t count, int pageSize)
{
    if (pageSize < 1)
        pageSize = 10;

    auto const size = static_cast<std::size_t>(pageSize);
    return (count + size - 1) / size;
}

} // namespace fieldkit
