#include "fieldkit.hpp"

#include <cctype>
#include <charconv>
#include <ostream>

namespace fieldkit
{
namespace
{
std::string_view trim(std::string_view str)
{
    auto const isSpace = [] (char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    while (! str.empty() && isSpace(str.front()))
        str.remove_prefix(1);

    while (! str.empty() && isSpace(str.back()))
        str.remove_suffix(1);

    return str;
}

bool equalsIgnoreCase(std::string_view a, std::string_view b)
{
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [] (char x, char y)
           {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

/// Parses the whole of str as a number, a leading '+' is accepted
template <typename Number>
std::optional<Number> parseNumber(std::string_view str)
{
    str = trim(str);

    if (str.starts_with('+'))
        str.remove_prefix(1);

    if (str.empty())
        return std::nullopt;

    Number result{};
    auto const [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), result);

    if (ec != std::errc() || ptr != str.data() + str.size())
        return std::nullopt;

    return result;
}

/// Parses exactly count digits from the front of str
std::optional<int> takeDigits(std::string_view& str, std::size_t count)
{
    if (str.size() < count)
        return std::nullopt;

    int result = 0;
    for (std::size_t i = 0; i < count; ++i)
    {
        if (! std::isdigit(static_cast<unsigned char>(str[i])))
            return std::nullopt;

        result = result * 10 + (str[i] - '0');
    }

    str.remove_prefix(count);
    return result;
}

bool takeChar(std::string_view& str, char c)
{
    if (! str.starts_with(c))
        return false;

    str.remove_prefix(1);
    return true;
}

// YYYY-MM-DD[(T| )HH:MM[:SS[.ffffff]]][Z]
std::optional<Timestamp> parseTimestamp(std::string_view str)
{
    using namespace std::chrono;

    str = trim(str);

    auto const y = takeDigits(str, 4);
    if (! y || ! takeChar(str, '-'))
        return std::nullopt;

    auto const m = takeDigits(str, 2);
    if (! m || ! takeChar(str, '-'))
        return std::nullopt;

    auto const d = takeDigits(str, 2);
    if (! d)
        return std::nullopt;

    year_month_day const date{year(*y), month(static_cast<unsigned>(*m)), day(static_cast<unsigned>(*d))};
    if (! date.ok())
        return std::nullopt;

    microseconds timeOfDay{0};

    if (takeChar(str, 'T') || takeChar(str, 't') || takeChar(str, ' '))
    {
        auto const hh = takeDigits(str, 2);
        if (! hh || *hh > 23 || ! takeChar(str, ':'))
            return std::nullopt;

        auto const mm = takeDigits(str, 2);
        if (! mm || *mm > 59)
            return std::nullopt;

        int ss = 0;
        if (takeChar(str, ':'))
        {
            auto const parsed = takeDigits(str, 2);
            if (! parsed || *parsed > 59)
                return std::nullopt;

            ss = *parsed;
        }

        std::int64_t fraction = 0;
        if (takeChar(str, '.'))
        {
            std::size_t digits = 0;
            while (! str.empty() && std::isdigit(static_cast<unsigned char>(str.front())))
            {
                // digits beyond microseconds are truncated
                if (digits < 6)
                    fraction = fraction * 10 + (str.front() - '0');

                ++digits;
                str.remove_prefix(1);
            }

            if (digits == 0)
                return std::nullopt;

            for (; digits < 6; ++digits)
                fraction *= 10;
        }

        timeOfDay = hours(*hh) + minutes(*mm) + seconds(ss) + microseconds(fraction);
    }

    if (str == "Z" || str == "z")
        str = {};

    if (! str.empty())
        return std::nullopt;

    return Timestamp(sys_days(date).time_since_epoch() + timeOfDay);
}

std::string formatTimestamp(Timestamp t)
{
    using namespace std::chrono;

    auto const midnight = floor<days>(t);
    year_month_day const date(midnight);
    hh_mm_ss<microseconds> const time(t - midnight);

    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
                       static_cast<int>(date.year()), static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()),
                       time.hours().count(), time.minutes().count(), time.seconds().count(), time.subseconds().count());
}

class InvalidMeta : public MetaType
{
public:
    std::type_info const& typeInfo() const override { return typeid(void); }
    bool isOpaque() const override { return true; }
    std::unique_ptr<Value> construct() const override { return nullptr; }
};
} // namespace

//=============================================================================
// Mapping implementations
//=============================================================================
Mapping::Mapping(std::initializer_list<std::pair<std::string, Variant>> entries)
{
    for (auto const& [name, value] : entries)
        set(name, value);
}

void Mapping::set(std::string_view name, Variant value)
{
    auto it = std::find_if(begin(), end(), [name] (auto const& entry) { return entry.first == name; });

    if (it != end())
        it->second = std::move(value);
    else
        emplace_back(std::string(name), std::move(value));
}

Variant const* Mapping::find(std::string_view name) const
{
    auto it = std::find_if(begin(), end(), [name] (auto const& entry) { return entry.first == name; });
    return it != end() ? &it->second : nullptr;
}

std::vector<std::string> Mapping::names() const
{
    std::vector<std::string> result;
    result.reserve(size());

    for (auto const& entry : *this)
        result.push_back(entry.first);

    return result;
}

bool operator==(Mapping const& lhs, Mapping const& rhs)
{
    if (lhs.size() != rhs.size())
        return false;

    for (std::size_t i = 0; i < lhs.size(); ++i)
    {
        if (lhs[i].first != rhs[i].first || ! (lhs[i].second == rhs[i].second))
            return false;
    }

    return true;
}

//=============================================================================
// Variant implementations
//=============================================================================
std::string Variant::toString() const
{
    switch (kind())
    {
    case Kind::null:      return "null";
    case Kind::record:
    {
        std::ostringstream ss;
        ss << std::get<Mapping>(*this);
        return ss.str();
    }
    default:              return detail::coerceToString(*this).value_or(std::string());
    }
}

bool operator==(Variant const& lhs, Variant const& rhs)
{
    // NaN equals NaN, so a record always equals itself
    if (lhs.kind() == Kind::real && rhs.kind() == Kind::real)
    {
        auto const a = std::get<double>(lhs);
        auto const b = std::get<double>(rhs);
        return a == b || (std::isnan(a) && std::isnan(b));
    }

    return static_cast<Variant::Base const&>(lhs) == static_cast<Variant::Base const&>(rhs);
}

std::partial_ordering compare(Variant const& lhs, Variant const& rhs)
{
    auto const isNumeric = [] (Kind k) { return k == Kind::integer || k == Kind::real; };

    if (isNumeric(lhs.kind()) && isNumeric(rhs.kind()))
    {
        if (lhs.kind() == Kind::integer && rhs.kind() == Kind::integer)
            return std::get<std::int64_t>(lhs) <=> std::get<std::int64_t>(rhs);

        auto const a = *detail::coerceToReal(lhs);
        auto const b = *detail::coerceToReal(rhs);

        // NaN sorts before every number
        if (std::isnan(a) || std::isnan(b))
            return static_cast<int>(! std::isnan(a)) <=> static_cast<int>(! std::isnan(b));

        return a <=> b;
    }

    if (lhs.kind() != rhs.kind())
        return lhs.index() <=> rhs.index();

    switch (lhs.kind())
    {
    case Kind::boolean:   return std::get<bool>(lhs) <=> std::get<bool>(rhs);
    case Kind::string:    return std::get<std::string>(lhs) <=> std::get<std::string>(rhs);
    case Kind::timestamp: return std::get<Timestamp>(lhs) <=> std::get<Timestamp>(rhs);
    case Kind::record:    return lhs == rhs ? std::partial_ordering::equivalent : std::partial_ordering::unordered;
    default:              return std::partial_ordering::equivalent;
    }
}

std::string_view describe(AccessError error)
{
    switch (error)
    {
    case AccessError::absentRecord:   return "record is absent";
    case AccessError::unknownField:   return "no field with this name";
    case AccessError::notReadable:    return "field is not readable";
    case AccessError::notWritable:    return "field is not writable";
    case AccessError::coercionFailed: return "value cannot be coerced to the field type";
    }

    return "unknown error";
}

//=============================================================================
// Coercion rules
//=============================================================================
namespace detail
{
std::optional<bool> coerceToBoolean(Variant const& value)
{
    switch (value.kind())
    {
    case Kind::boolean: return std::get<bool>(value);
    case Kind::integer: return std::get<std::int64_t>(value) != 0;
    case Kind::real:    return std::get<double>(value) != 0.0;
    case Kind::string:
    {
        auto const str = trim(std::get<std::string>(value));

        if (equalsIgnoreCase(str, "true"))
            return true;

        if (equalsIgnoreCase(str, "false"))
            return false;

        return std::nullopt;
    }
    default:            return std::nullopt;
    }
}

std::optional<std::int64_t> coerceToInteger(Variant const& value, std::int64_t min, std::int64_t max)
{
    std::optional<std::int64_t> result;

    switch (value.kind())
    {
    case Kind::boolean: result = std::get<bool>(value) ? 1 : 0; break;
    case Kind::integer: result = std::get<std::int64_t>(value); break;
    case Kind::string:  result = parseNumber<std::int64_t>(std::get<std::string>(value)); break;
    case Kind::real:
    {
        auto const r = std::nearbyint(std::get<double>(value));

        // -min is the first value past max for the two's complement targets
        if (! std::isfinite(r) || r < static_cast<double>(min) || r >= -static_cast<double>(min))
            return std::nullopt;

        result = static_cast<std::int64_t>(r);
        break;
    }
    default:            return std::nullopt;
    }

    if (! result || *result < min || *result > max)
        return std::nullopt;

    return result;
}

std::optional<double> coerceToReal(Variant const& value)
{
    switch (value.kind())
    {
    case Kind::boolean: return std::get<bool>(value) ? 1.0 : 0.0;
    case Kind::integer: return static_cast<double>(std::get<std::int64_t>(value));
    case Kind::real:    return std::get<double>(value);
    case Kind::string:  return parseNumber<double>(std::get<std::string>(value));
    default:            return std::nullopt;
    }
}

std::optional<std::string> coerceToString(Variant const& value)
{
    switch (value.kind())
    {
    case Kind::string:    return std::get<std::string>(value);
    case Kind::boolean:   return std::string(std::get<bool>(value) ? "true" : "false");
    case Kind::integer:   return std::to_string(std::get<std::int64_t>(value));
    case Kind::real:      return std::format("{}", std::get<double>(value));
    case Kind::timestamp: return formatTimestamp(std::get<Timestamp>(value));
    default:              return std::nullopt;
    }
}

std::optional<Timestamp> coerceToTimestamp(Variant const& value)
{
    switch (value.kind())
    {
    case Kind::timestamp: return std::get<Timestamp>(value);
    case Kind::string:    return parseTimestamp(std::get<std::string>(value));
    default:              return std::nullopt;
    }
}
} // namespace detail

//=============================================================================
// Value implementations
//=============================================================================

// Initialize the global invalid value singleton
Invalid& Value::kInvalid = std::invoke([] () -> Invalid&
{
    static Invalid invld;
    return invld;
});

MetaType const& Invalid::metaType() const
{
    static InvalidMeta const meta;
    return meta;
}

Variant Invalid::toVariant() const
{
    return {};
}

//=============================================================================
// Object implementations
//=============================================================================
Mapping Object::toMapping() const
{
    Mapping result;

    for (auto const& fld : typeErasedFields())
    {
        if (fld.get().isReadable())
            result.emplace_back(fld.get().fieldname(), fld.get().toVariant());
    }

    return result;
}

std::expected<void, AccessError> Object::assignField(std::string_view fldname, Variant const& newValue, Policy policy)
{
    auto& fld = (*this)(fldname);

    if (! fld)
        return std::unexpected(AccessError::unknownField);

    if (! fld.isWritable())
        return std::unexpected(AccessError::notWritable);

    if (! fld.assign(newValue, policy))
        return std::unexpected(AccessError::coercionFailed);

    return {};
}

bool Object::applyMapping(Mapping const& mapping, Policy policy)
{
    for (auto const& [name, value] : mapping)
    {
        auto const result = assignField(name, value, policy);

        if (! result && result.error() == AccessError::coercionFailed && policy == Policy::strict)
            return false;
    }

    return true;
}

Variant Object::toVariant() const
{
    return toMapping();
}

//=============================================================================
// MetaType implementations
//=============================================================================
FieldDescriptor const* MetaType::field(std::string_view name) const
{
    auto const flds = fields();
    auto it = std::find_if(flds.begin(), flds.end(), [name] (auto const& fld) { return fld.fieldname == name; });

    return it != flds.end() ? &*it : nullptr;
}

//=============================================================================
// Stream operators
//=============================================================================
std::ostream& operator<<(std::ostream& o, Variant const& x)
{
    return o << x.toString();
}

std::ostream& operator<<(std::ostream& o, Mapping const& x)
{
    if (x.empty())
        return o << "{}";

    o << "{ ";
    auto first = true;

    for (auto const& [name, value] : x)
    {
        if (! std::exchange(first, false))
            o << ", ";

        o << "." << name << " = " << value;
    }

    o << " }";
    return o;
}

std::ostream& operator<<(std::ostream& o, AccessError x)
{
    return o << describe(x);
}

std::ostream& operator<<(std::ostream& o, Value const& x)
{
    return o << x.toVariant();
}

std::ostream& operator<<(std::ostream& o, Object const& x)
{
    return o << x.toMapping();
}

std::ostream& operator<<(std::ostream& o, Invalid const&)
{
    return o;
}
} // namespace fieldkit
