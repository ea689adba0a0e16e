/**
 * @file fieldkit_access.hpp
 * @brief Name based field access on records of unknown shape
 *
 * The functions in this file work on any Value. A Value that is not a valid
 * record (Value::kInvalid, a scalar) is treated as an absent record. None of
 * them throws: misses and conversion failures are reported as an empty
 * result, a zero value or false.
 *
 * @code
 * Record<User> user;
 * setField(user, "Name", "Ada");
 * auto name = getField<std::string>(user, "Name");
 * auto dto  = copyAllFields<UserSummary>(user);
 * @endcode
 */

#pragma once

#include <cassert>
#include "fieldkit.hpp"

namespace fieldkit
{

using FieldNames = std::vector<std::string>;

namespace detail
{
/// True if record is a valid struct value
inline bool isPresentRecord(Value const& record) { return record.isValid() && record.isStruct(); }

/// getField/setField every name from source into target
void copyInto(Value const& source, Value& target, FieldNames const& names);
} // namespace detail

//=============================================================================
// Explicit presence
//=============================================================================

/// Returns true if record is present and declares a field called name
bool hasField(Value const& record, std::string_view name);

/**
 * @brief Read a field and tell why if that is not possible
 *
 * @return the field's value, or absentRecord, unknownField or notReadable
 */
std::expected<Variant, AccessError> tryGetField(Value const& record, std::string_view name);

/**
 * @brief Write a field with lenient coercion and tell why if that is not possible
 *
 * @return nothing on success, or absentRecord, unknownField, notWritable or
 *         coercionFailed. The field keeps its previous value on any error.
 */
std::expected<void, AccessError> trySetField(Value& record, std::string_view name, Variant const& value);

//=============================================================================
// Scalar conversion
//=============================================================================

/// Coerces source to T, or returns T{} if that is not possible
template <typename T>
T convertToScalar(Variant const& source)
{
    return coerce<T>(source).value_or(T{});
}

/// Coerces the current value of source to T, or returns T{} if that is not possible
template <typename T>
T convertToScalar(Value const& source)
{
    return convertToScalar<T>(source.toVariant());
}

//=============================================================================
// Single field access
//=============================================================================

/**
 * @brief Read the named field coerced to R
 *
 * With the default R = Variant the raw value is returned. Any miss (absent
 * record, unknown or write-only field, failed coercion) returns R{}, so a
 * missing field cannot be told apart from one holding the zero value. Use
 * tryGetField for that.
 */
template <typename R = Variant>
R getField(Value const& record, std::string_view name)
{
    return convertToScalar<R>(tryGetField(record, name).value_or(Variant()));
}

/**
 * @brief Write the named field
 *
 * @return true only if the field was updated. Unknown and read-only fields as
 *         well as values that cannot be coerced leave the record untouched.
 */
bool setField(Value& record, std::string_view name, Variant const& value);

//=============================================================================
// Mappings
//=============================================================================

/// Returns every readable field in declaration order, or an empty mapping for an absent record
Mapping toMapping(Value const& record);

/// Returns the names of every readable field in declaration order
FieldNames readableFieldNames(Value const& record);

/**
 * @brief Build a new record of targetType from a mapping
 *
 * Starts from a zero-initialized instance and applies every entry with
 * setField, in mapping order. Entries that cannot be applied are skipped.
 *
 * @return the new record, or nullptr if targetType cannot be constructed as a record
 */
std::unique_ptr<Value> fromMapping(Mapping const& mapping, MetaType const& targetType);

template <typename Target>
std::optional<Record<Target>> fromMapping(Mapping const& mapping)
{
    Record<Target> target;

    auto const applied = target.applyMapping(mapping, Policy::lenient);
    assert(applied); // lenient application does not fail
    (void)applied;

    return target;
}

//=============================================================================
// Record conversion
//=============================================================================

/**
 * @brief Converts a record into a Mapping and back into another record type
 *
 * The default transcoder encodes with toMapping() and decodes strictly: names
 * unknown to the target and read-only target fields are skipped, but a value
 * that cannot be coerced fails the whole decode.
 */
class Transcoder
{
public:
    virtual ~Transcoder() = default;

    virtual Mapping encode(Value const& source) const = 0;

    /// Applies mapping to target, returns false if the decode failed
    virtual bool decode(Mapping const& mapping, Value& target) const = 0;

    /// Returns the default transcoder
    static Transcoder const& standard();
};

/// Returns source as a Record<Target> without copying, or nullptr if it is of another type
template <typename Target>
Record<Target> const* asRecord(Value const& source)
{
    return dynamic_cast<Record<Target> const*>(&source);
}

/**
 * @brief Convert a record to another record type
 *
 * A source that already is of the target type is cloned unchanged. Otherwise
 * the source is encoded and decoded into a zero-initialized target. Use
 * asRecord<Target>() to get the identical instance instead of a copy.
 *
 * @return the converted record, or nullptr if the source is absent, the target
 *         is not a record type or the transcoder failed
 */
std::unique_ptr<Value> convertTo(Value const& source, MetaType const& targetType,
                                 Transcoder const& transcoder = Transcoder::standard());

template <typename Target>
std::optional<Record<Target>> convertTo(Value const& source, Transcoder const& transcoder = Transcoder::standard())
{
    if (auto const* same = asRecord<Target>(source))
        return *same;

    if (! detail::isPresentRecord(source))
        return std::nullopt;

    Record<Target> target;

    if (! transcoder.decode(transcoder.encode(source), target))
        return std::nullopt;

    return target;
}

//=============================================================================
// Copying, clearing and comparing
//=============================================================================

/**
 * @brief Copy the named fields of source into a new record of targetType
 *
 * Each value is read raw from the source and written with setField. A name the
 * source does not have writes null, which empties a nullable target field and
 * leaves any other at its zero value.
 *
 * @return the new record, or nullptr if the source is absent, names is empty
 *         or targetType cannot be constructed as a record
 */
std::unique_ptr<Value> copyFields(Value const& source, MetaType const& targetType, FieldNames const& names);

template <typename Target>
std::optional<Record<Target>> copyFields(Value const& source, FieldNames const& names)
{
    if (! detail::isPresentRecord(source) || names.empty())
        return std::nullopt;

    Record<Target> target;
    detail::copyInto(source, target, names);
    return target;
}

/**
 * @brief copyFields() with every readable field of source
 *
 * Read-only fields of the target are not written, so copying a record into
 * its own type leaves them at their zero value.
 */
std::unique_ptr<Value> copyAllFields(Value const& source, MetaType const& targetType);

template <typename Target>
std::optional<Record<Target>> copyAllFields(Value const& source)
{
    return copyFields<Target>(source, readableFieldNames(source));
}

/// Writes null to each named field. Non-nullable fields keep their value.
void clearFields(Value& record, FieldNames const& names);

/// Sets each named writable field to the zero value of its type
void resetFields(Value& record, FieldNames const& names);

/**
 * @brief Compare the named fields of two records
 *
 * @return false if either record is absent, true if names is empty, otherwise
 *         true if every named field holds an equal value in both records
 */
bool fieldsEqual(Value const& a, Value const& b, FieldNames const& names);

/// Returns the names whose values differ, in the order given. Empty if either record is absent.
FieldNames changedFields(Value const& original, Value const& current, FieldNames const& names);

} // namespace fieldkit
