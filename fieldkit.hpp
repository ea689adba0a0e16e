/**
 * @file fieldkit.hpp
 * @brief Runtime field access for structs built from Field<> members
 *
 * This file implements the reflection layer of fieldkit. Every member of a
 * struct is wrapped in a Field<T, Name> template, which allows the struct to
 * be introspected at runtime:
 *   - Iteration through field names and values in declaration order
 *   - Type-erased access via the Value base class
 *   - Conversion of any field to and from a Variant with type coercion
 *   - Type descriptors (MetaType) that can construct zero-initialized records
 *
 * Usage example:
 *   struct Point {
 *       Field<float, "x"> x;
 *       Field<float, "y"> y;
 *   };
 *   Record<Point> point;
 *   point("x"_fld) = 3.14f;        // Access field by compile-time name
 *   point("y").assign(Variant("2.5"), Policy::lenient);  // ... or by runtime name
 */

#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>
#include <vector>
#include <fixed_string.hpp>
#include "fieldkit_detail.hpp"

namespace fieldkit
{

/// Point in time with microsecond resolution, always UTC
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

struct Variant;

/**
 * @brief Ordered snapshot of a record's fields
 *
 * Mapping stores (name, value) pairs in the order the record declares its
 * fields. Setting a name that already exists replaces the value in place,
 * so a name appears at most once.
 */
struct Mapping : std::vector<std::pair<std::string, Variant>>
{
    using Base = std::vector<std::pair<std::string, Variant>>;

    Mapping() = default;
    Mapping(std::initializer_list<std::pair<std::string, Variant>> entries);

    /// Insert or replace the value stored under name
    void set(std::string_view name, Variant value);

    /// Returns the value stored under name, or nullptr
    Variant const* find(std::string_view name) const;

    bool contains(std::string_view name) const { return find(name) != nullptr; }

    /// Returns all names in order
    std::vector<std::string> names() const;
};

/// The kind of value held by a Variant. Matches the Variant's alternative index.
enum class Kind
{
    null,
    boolean,
    integer,
    real,
    string,
    timestamp,
    record
};

/**
 * @brief A field value detached from its record
 *
 * Variant is the value type of a Mapping. Integral fields are widened to
 * std::int64_t, floating point fields to double and an empty std::optional
 * becomes null. Nested records are stored as a Mapping.
 */
struct Variant : std::variant<std::monostate, bool, std::int64_t, double, std::string, Timestamp, Mapping>
{
    using Base = std::variant<std::monostate, bool, std::int64_t, double, std::string, Timestamp, Mapping>;

    Variant() = default;
    Variant(std::nullopt_t) {}
    Variant(bool b)              : Base(std::in_place_type<bool>, b) {}
    Variant(std::int32_t i)      : Base(std::in_place_type<std::int64_t>, i) {}
    Variant(std::int64_t i)      : Base(std::in_place_type<std::int64_t>, i) {}
    Variant(float f)             : Base(std::in_place_type<double>, f) {}
    Variant(double d)            : Base(std::in_place_type<double>, d) {}
    Variant(std::string s)       : Base(std::in_place_type<std::string>, std::move(s)) {}
    Variant(std::string_view s)  : Base(std::in_place_type<std::string>, s) {}
    Variant(char const* s)       : Base(std::in_place_type<std::string>, s) {}
    Variant(Timestamp t)         : Base(std::in_place_type<Timestamp>, t) {}
    Variant(Mapping m)           : Base(std::in_place_type<Mapping>, std::move(m)) {}

    template <typename T>
    Variant(std::optional<T> const& o) : Variant()
    {
        if (o.has_value())
            *this = Variant(*o);
    }

    Kind kind() const { return static_cast<Kind>(index()); }
    bool isNull() const { return kind() == Kind::null; }

    /// Human readable rendering: strings as is, timestamps in ISO 8601
    std::string toString() const;
};

/// Deep equality. Values of different kinds are never equal, NaN equals NaN.
bool operator==(Variant const& lhs, Variant const& rhs);
bool operator==(Mapping const& lhs, Mapping const& rhs);

/**
 * @brief Orders two variants
 *
 * null sorts first, integers and reals compare numerically with each other
 * with NaN before every number, other kinds of different type order by Kind.
 * Records are unordered unless they are equal.
 */
std::partial_ordering compare(Variant const& lhs, Variant const& rhs);

/**
 * @brief How a nested Mapping is applied to a record
 *
 * lenient: entries that fail are skipped and the rest still applies.
 * strict: unknown and non-writable names are skipped, but an entry whose value
 * cannot be coerced fails the whole application.
 */
enum class Policy
{
    lenient,
    strict
};

/// Why a named access did not happen
enum class AccessError
{
    absentRecord,
    unknownField,
    notReadable,
    notWritable,
    coercionFailed
};

std::string_view describe(AccessError error);

/**
 * @brief Coerce a variant to one of the supported field types
 *
 * @return the coerced value or an empty optional if the conversion is not
 *         possible (wrong kind, out of range, unparsable string, null into a
 *         non-nullable type)
 */
template <typename T>
std::optional<T> coerce(Variant const& value);

/**
 * @brief Compile-time string wrapper for use with the "_fld" literal
 *
 * @tparam S The compile-time fixed string representing the field name
 *
 * @see operator""_fld
 */
template <fixstr::fixed_string S>
struct CompileTimeString { static constexpr auto value = S; };

// Forward declarations
template <typename T> class Fundamental;
template <typename T> class Record;
class Object;
class Value;
class Invalid;
class MetaType;

/**
 * @brief Describes a single field within a Record's MetaType
 *
 * Provides the field name, its access rights and a function pointer to lazily
 * obtain the MetaType of the field's underlying type, avoiding static
 * initialization order issues with nested types.
 */
struct FieldDescriptor
{
    std::string_view fieldname;
    Access access;
    MetaType const& (*metaType)();

    bool isReadable() const { return access != Access::writeOnly; }
    bool isWritable() const { return access != Access::readOnly; }
};

//=============================================================================
// Public API classes
//=============================================================================

/**
 * @brief Abstract base class for type-erased values in the reflection system
 *
 * Value provides a common interface for accessing values of unknown
 * type at runtime. It supports:
 *   - Type identification via type(), metaType() and isStruct()
 *   - Validity checking via isValid() and operator bool()
 *   - Reading via toVariant() and coercing writes via assign()
 *   - Field naming and access rights for struct members
 *
 * Derived classes include:
 *   - Invalid: Sentinel for invalid/missing fields and absent records
 *   - Fundamental<T>: Concrete wrapper for scalar types
 *   - Object: Base for struct types with fields
 *   - Field<T, Name>: Named field within a struct
 */
class Value
{
private:
    /// Scalar types a Field<> may hold
    using SupportedFundamentalTypes = std::tuple<
        std::int32_t, std::int64_t,
        float, double,
        bool,
        std::string, Timestamp,
        std::optional<std::int32_t>, std::optional<std::int64_t>,
        std::optional<float>, std::optional<double>,
        std::optional<bool>,
        std::optional<std::string>, std::optional<Timestamp>
    >;

public:
    /// Global singleton representing an invalid/missing value
    static Invalid& kInvalid;

    virtual ~Value() = default;

    /// Returns the std::type_info for the underlying value type
    virtual std::type_info const& type() const = 0;

    /// Returns the MetaType descriptor for this value's type
    virtual MetaType const& metaType() const = 0;

    /// Returns true if this value represents a struct with fields
    virtual bool isStruct() const { return false; }

    /// Returns true if this value is valid (not Invalid)
    virtual bool isValid() const = 0;

    /// Returns the field name if this value is a named field, empty otherwise
    virtual std::string fieldname() const { return {}; }

    /// Returns the access rights if this value is a named field
    virtual Access access() const { return Access::readWrite; }

    bool isReadable() const { return access() != Access::writeOnly; }
    bool isWritable() const { return access() != Access::readOnly; }

    /// Converts to bool based on validity (same as isValid())
    operator bool() const { return isValid(); }

    /// Returns a snapshot of the value. Structs return their readable fields as a Mapping.
    virtual Variant toVariant() const = 0;

    /**
     * @brief Coerce newValue to the underlying type and store it
     *
     * The write is atomic: if the coercion fails, the value is left untouched.
     * Access rights are not checked here, they are the accessor's business.
     *
     * @return true if the value was stored
     */
    virtual bool assign(Variant const& newValue, Policy policy) = 0;

    /// Sets the value to the zero value of its type
    virtual void reset() = 0;

    /// Returns a heap copy of this value without its field name, or nullptr for Invalid
    virtual std::unique_ptr<Value> clone() const = 0;

    /// Returns false if T is a struct containing child fields of type Field<>
    template <typename T>
    static constexpr bool isOpaque();

protected:
    template <typename T> friend class Fundamental;

    constexpr Value() = default;
    Value(Value const&) = default;
    Value(Value&&) = default;
    Value& operator=(Value const&) = default;
    Value& operator=(Value&&) = default;
};

/**
 * @brief Sentinel type representing an invalid or missing field
 *
 * Invalid is returned when a field lookup fails (e.g., accessing a
 * non-existent field name) and stands in for an absent record. It always
 * returns false for isValid() and reads as null.
 *
 * @code
 * auto& field = myRecord("nonexistent");
 * if (!field) {
 *     std::cout << "Field not found!" << std::endl;
 * }
 * @endcode
 */
class Invalid : public Value
{
public:
    /// Compile-time constant indicating this is not a valid value
    static constexpr auto kIsValid = false;

    constexpr Invalid() = default;

    std::type_info const& type() const override { return typeid(void); }
    MetaType const& metaType() const override;
    bool isValid() const override { return false; }
    constexpr operator bool() const { return false; }
    Variant toVariant() const override;
    bool assign(Variant const&, Policy) override { return false; }
    void reset() override {}
    std::unique_ptr<Value> clone() const override { return nullptr; }
};

/**
 * @brief Abstract base class for struct types containing Field<> members
 *
 * Object extends Value to add struct-specific functionality:
 *   - Field iteration via typeErasedFields()
 *   - Runtime field access by name via operator()(string_view)
 *   - Snapshots as a Mapping and application of a Mapping
 *
 * @see Record<T> for the concrete implementation
 */
class Object : public Value
{
public:
    bool isStruct() const override { return true; }

    /// Returns a vector of references to all fields (const version)
    virtual std::vector<std::reference_wrapper<Value const>> typeErasedFields() const = 0;

    /// Returns a vector of references to all fields (mutable version)
    virtual std::vector<std::reference_wrapper<Value>> typeErasedFields() = 0;

    /**
     * @brief Access a field by name at runtime
     *
     * @param fldname The name of the field to access
     * @return Reference to the field, or kInvalid if not found
     */
    auto operator()(this auto&& self, std::string_view fldname)
        -> std::conditional_t<std::is_const_v<std::remove_reference_t<decltype(self)>>,
                              Value const&,
                              Value&>;

    /// Returns all readable fields in declaration order
    Mapping toMapping() const;

    /**
     * @brief Write a single field by name
     *
     * Resolves the name, checks that the field is writable and coerces the
     * value. The field is left untouched on any error.
     */
    std::expected<void, AccessError> assignField(std::string_view fldname, Variant const& newValue, Policy policy);

    /**
     * @brief Write every entry of mapping in order
     *
     * @return false only if policy is strict and an entry could not be coerced.
     *         The fields written before that entry keep their new values.
     */
    bool applyMapping(Mapping const& mapping, Policy policy);

    Variant toVariant() const override;

protected:
    Object() = default;
};

/**
 * @brief Concrete wrapper for a value of type T
 *
 * Fundamental<T> provides a type-safe container for values that:
 *   - Reads and writes through Variant with coercion
 *   - Can be used both for scalar types and struct types containing Fields
 *
 * For scalar types (int32_t, double, std::string, Timestamp, ...),
 * Fundamental<T> derives from Value. For struct types with Field<> members,
 * Fundamental<T> derives from Object.
 *
 * @tparam T The underlying value type (must be a supported scalar or a struct with Fields)
 *
 * @see Record<T> for extended struct functionality
 * @see Field<T, Name> for named struct members
 */
template <typename T>
class Fundamental : public std::conditional_t<Value::isOpaque<T>(), Value, Object>
{
public:
    /// False if T is a struct containing Field<> members
    static constexpr auto kIsOpaque = Value::isOpaque<T>();

    // T must either be a struct with Fields (see Field class below) or it must be one of SupportedFundamentalTypes
    static_assert((! kIsOpaque) || detail::is_one_of<T, Value::SupportedFundamentalTypes>::value);

    using Base = std::conditional_t<kIsOpaque, Value, Object>;

    /// Compile-time constant indicating this is always a valid value
    static constexpr auto kIsValid = true;

    /// Default constructor - creates a Fundamental with value-initialized value
    Fundamental();

    /// Construct from underlying value
    Fundamental(T underlying_);

    Fundamental(Fundamental const& o);
    Fundamental(Fundamental&& o);

    ~Fundamental() override = default;

    /// Returns the type_info for the underlying type T
    std::type_info const& type() const override { return typeid(T); }

    /// Returns the MetaType for the underlying type T (static, no instance needed)
    static MetaType const& meta();

    /// Returns the MetaType for this value's underlying type
    MetaType const& metaType() const override;

    /// Always returns true - Fundamental values are always valid
    bool isValid() const override { return true; }

    /// Always returns true - Fundamental values are always valid (disabled for bool to avoid conflict with operator T())
    constexpr operator bool() const requires (!std::is_same_v<T, bool>) { return true; }

    Fundamental& operator=(T const& newValue);
    Fundamental& operator=(Fundamental const& newValue);
    Fundamental& operator=(Fundamental && newValue);

    /// Returns the underlying value (read-only access)
    T const& operator()() const { return underlying; }

    /// Member access for struct types - allows chaining through Field members
    T*       operator->()       requires (!kIsOpaque) { return &underlying; }
    T const* operator->() const requires (!kIsOpaque) { return &underlying; }

    void set(T const& newValue);
    void set(T && newValue);

    /// Implicit conversion to the underlying type
    operator T() const { return underlying; }

    // overridden base methods
    Variant toVariant() const override;
    bool assign(Variant const& newValue, Policy policy) override;
    void reset() override;
    std::unique_ptr<Value> clone() const override;

protected:
    T underlying;
};

/**
 * @brief User-defined literal for creating compile-time field name tags
 *
 * The syntax "fieldname"_fld creates a tag that can be passed to
 * Record::operator() for compile-time verified field access.
 *
 * @code
 * point("x"_fld) = 3.14f;
 * line("start"_fld)("x"_fld) = 1.0f;
 * @endcode
 */
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld();
#pragma GCC diagnostic pop

/**
 * @brief Concrete implementation of Fundamental<T> for struct types with extended field access
 *
 * Record extends Fundamental<T> to provide:
 *   - Compile-time field access via operator()(CompileTimeString) using "_fld" literal
 *   - Runtime field access via operator()(std::string_view)
 *   - Field iteration via visitFields() and visitField()
 *   - Static kFieldNames array containing all field names
 *
 * This is the primary way to work with reflection-enabled structs at the top level.
 *
 * @tparam T A struct type where all members are wrapped in Field<Type, "name">
 *
 * @code
 * struct Point {
 *     Field<float, "x"> x;
 *     Field<float, "y"> y;
 * };
 *
 * Record<Point> point;
 * point("x"_fld) = 3.14f;              // Compile-time field access
 * point.visitFields([](auto name, auto& fld) { ... });  // Iterate all fields
 * @endcode
 */
template <typename T>
class Record : public Fundamental<T>
{
private:
    static auto fields_with(T& u);
    static auto fields_with(T const& u);
public:
    using Object::operator();

    Record();
    Record(T const& underlying_);
    Record(Record const& o);
    Record(Record&& o);

    Record& operator=(Record const& o);
    Record& operator=(Record&& o);

    /// Returns the underlying struct value (const access)
    T const& operator()() const { return Fundamental<T>::operator()(); }

    //=============================================================================
    // Type aliases for field access
    //=============================================================================

    /// Tuple type of references to all fields
    using ReferenceTuple = decltype(fields_with(std::declval<T>()));

    /// Tuple type of all field types (decayed)
    using FieldsAsTuple = detail::decay_tuple<ReferenceTuple>::type;
    static_assert(std::tuple_size_v<FieldsAsTuple> >= 1);

    /// Compile-time array of all field names in declaration order
    static constexpr std::array<std::string_view const, std::tuple_size_v<FieldsAsTuple>> kFieldNames =
        std::invoke([] <typename... Types> (std::type_identity<std::tuple<Types...>>)
        {
            std::array<std::string_view const, std::tuple_size_v<FieldsAsTuple>> returnValue = {{
                std::string_view(Types::kName)...
            }};

            return returnValue;
        }, std::type_identity<FieldsAsTuple>());

    /**
     * @brief Access a field by compile-time name using "_fld" literal
     *
     * @tparam FieldName Compile-time string from "_fld" literal
     * @return Reference to the field (typed as the actual Field<> type)
     */
    template <fixstr::fixed_string FieldName>
    auto&& operator()(this auto& self, CompileTimeString<FieldName>);

    /// Returns a tuple of references to all typed Field<> members
    auto fields(this auto& self);

    std::vector<std::reference_wrapper<Value const>> typeErasedFields() const override;
    std::vector<std::reference_wrapper<Value>> typeErasedFields() override;

    /**
     * @brief Visit all fields with a lambda
     *
     * @param lambda Callable taking (std::string_view name, Field& field)
     */
    template <typename Lambda>
    void visitFields(this auto& self, Lambda && lambda);

    /**
     * @brief Visit a single field by runtime name
     *
     * Returns whatever the lambda returns wrapped in an optional. If no field
     * is found that has the name str, then this method returns an empty optional.
     * If the lambda does not return anything, then this method returns a bool,
     * with true indicating success.
     */
    template <typename Lambda>
    auto visitField(this auto& self, std::string_view const& str, Lambda && lambda);

private:
    auto typeErasedFields_internal(this auto& self);
};

/**
 * @brief Named field wrapper for use as struct members
 *
 * Field is the key building block for reflection-enabled structs. Each member
 * of a struct should be wrapped in Field<Type, "name"> to enable:
 *   - Runtime lookup by name
 *   - Integration with Record's field iteration and the accessor functions
 *   - Access rights enforced by the accessor (read-write, read-only, write-only)
 *
 * For scalar types, Field derives from Fundamental<T>.
 * For struct types (containing their own Field<> members), Field derives from Record<T>.
 *
 * @code
 * struct Account {
 *     Field<std::int64_t, "Id", Access::readOnly> id;
 *     Field<std::string, "Owner"> owner;
 *     Field<bool, "IsActive"> isActive = true;
 * };
 * @endcode
 */
template <typename T, fixstr::fixed_string Name, Access kAccess = Access::readWrite>
class Field : public detail::BaseTypeFor<T>
{
public:
    using Base = detail::BaseTypeFor<T>;
    using ValueType = T;

    static constexpr auto kName = Name;
    static constexpr auto kFieldAccess = kAccess;

    Field() = default;
    Field(T const& t) : Base(t) {}

    Field& operator=(T const& t);
    Field& operator=(T && t);

    /// Returns the compile-time field name as specified in the template parameter
    std::string fieldname() const override;

    Access access() const override { return kAccess; }
};

template <typename T, fixstr::fixed_string Name>
using ReadOnlyField = Field<T, Name, Access::readOnly>;

template <typename T, fixstr::fixed_string Name>
using WriteOnlyField = Field<T, Name, Access::writeOnly>;

//=============================================================================
// MetaType system - type reflection without instances
//=============================================================================

/**
 * @brief Abstract base class for type metadata
 *
 * MetaType provides a type-erased interface for inspecting types without
 * requiring an instance:
 *   - The underlying C++ type (via typeInfo())
 *   - Whether it's a scalar (opaque) or a record
 *   - For records: field names, access rights and their MetaTypes (via fields())
 *   - A factory method to construct zero-initialized instances (via construct())
 *
 * @code
 * auto const& meta = metaTypeOf<Point>();
 * for (auto const& field : meta.fields())
 *     std::cout << field.fieldname << std::endl;
 *
 * auto instance = meta.construct();  // Creates a Record<Point>
 * @endcode
 */
class MetaType
{
public:
    virtual ~MetaType() = default;

    /// Returns the std::type_info for the underlying type
    virtual std::type_info const& typeInfo() const = 0;

    /// Returns true if this is a scalar type (not a struct with Fields)
    virtual bool isOpaque() const = 0;

    /// Returns true if this is a Record type (struct with Field<> members)
    virtual bool isRecord() const { return false; }

    /// Returns true if null can be stored (std::optional<> types)
    virtual bool isNullable() const { return false; }

    /// Field descriptors in declaration order, empty for non-Record types
    virtual std::span<FieldDescriptor const> fields() const { return {}; }

    /// Returns the descriptor of the named field or nullptr
    FieldDescriptor const* field(std::string_view name) const;

    /**
     * @brief Construct a new zero-initialized instance
     *
     * @return Fundamental<T> or Record<T> on the heap, or nullptr if the type
     *         cannot be default constructed (or for Invalid)
     */
    virtual std::unique_ptr<Value> construct() const = 0;
};

/**
 * @brief Get the MetaType for a given C++ type T
 *
 * Maps scalar types to a FundamentalMeta and structs with Field<> members to
 * a RecordMeta singleton.
 */
template <typename T>
MetaType const& metaTypeOf();

// Stream output operators
std::ostream& operator<<(std::ostream& o, Variant const& x);
std::ostream& operator<<(std::ostream& o, Mapping const& x);
std::ostream& operator<<(std::ostream& o, AccessError x);
std::ostream& operator<<(std::ostream& o, fieldkit::Value const& x);
std::ostream& operator<<(std::ostream& o, fieldkit::Object const& x);
std::ostream& operator<<(std::ostream& o, fieldkit::Invalid const& x);
} // namespace fieldkit

// std::formatter specializations
template <>
struct std::formatter<fieldkit::Variant> : std::formatter<std::string>
{
    auto format(fieldkit::Variant const& v, format_context& ctx) const
    {
        return std::formatter<std::string>::format(v.toString(), ctx);
    }
};

template <>
struct std::formatter<fieldkit::Mapping> : std::formatter<fieldkit::Variant>
{
    auto format(fieldkit::Mapping const& v, format_context& ctx) const
    {
        return std::formatter<fieldkit::Variant>::format(fieldkit::Variant(v), ctx);
    }
};

template <>
struct std::formatter<fieldkit::Value> : std::formatter<std::string>
{
    auto format(fieldkit::Value const& v, format_context& ctx) const;
};

template <>
struct std::formatter<fieldkit::Object> : std::formatter<fieldkit::Value> {};

template <typename T>
struct std::formatter<fieldkit::Fundamental<T>> : std::formatter<fieldkit::Value> {};

template <typename T>
struct std::formatter<fieldkit::Record<T>> : std::formatter<fieldkit::Value> {};

template <typename T, fixstr::fixed_string Name, fieldkit::Access kAccess>
struct std::formatter<fieldkit::Field<T, Name, kAccess>> : std::formatter<fieldkit::Value> {};

template <>
struct std::formatter<fieldkit::AccessError> : std::formatter<std::string_view>
{
    auto format(fieldkit::AccessError e, format_context& ctx) const
    {
        return std::formatter<std::string_view>::format(fieldkit::describe(e), ctx);
    }
};

// Include template implementations
#include "fieldkit.tpp"
