#pragma once

namespace fieldkit
{

namespace detail
{
// Non-template coercion rules, implemented in fieldkit.cpp
std::optional<bool>         coerceToBoolean(Variant const& value);
std::optional<std::int64_t> coerceToInteger(Variant const& value, std::int64_t min, std::int64_t max);
std::optional<double>       coerceToReal(Variant const& value);
std::optional<std::string>  coerceToString(Variant const& value);
std::optional<Timestamp>    coerceToTimestamp(Variant const& value);

/// MetaType for scalar types
template <typename T>
class FundamentalMeta : public MetaType
{
public:
    std::type_info const& typeInfo() const override { return typeid(T); }
    bool isOpaque() const override { return true; }
    bool isNullable() const override { return is_optional<T>::value; }
    std::unique_ptr<Value> construct() const override { return std::make_unique<Fundamental<T>>(); }
};

/// MetaType for structs with Field<> members
template <typename T>
class RecordMeta : public MetaType
{
public:
    std::type_info const& typeInfo() const override { return typeid(T); }
    bool isOpaque() const override { return false; }
    bool isRecord() const override { return true; }
    std::span<FieldDescriptor const> fields() const override { return descriptors(); }

    std::unique_ptr<Value> construct() const override
    {
        if constexpr (std::is_default_constructible_v<T>)
            return std::make_unique<Record<T>>();
        else
            return nullptr;
    }

private:
    static auto const& descriptors()
    {
        static auto const result = std::invoke([] <typename... Fields> (std::type_identity<std::tuple<Fields...>>)
        {
            return std::array<FieldDescriptor const, sizeof...(Fields)> {{
                FieldDescriptor { std::string_view(Fields::kName), Fields::kFieldAccess, &metaTypeOf<typename Fields::ValueType> }...
            }};
        }, std::type_identity<typename Record<T>::FieldsAsTuple>());

        return result;
    }
};
} // namespace detail

//=============================================================================
// Coercion
//=============================================================================
template <typename T>
std::optional<T> coerce(Variant const& value)
{
    if constexpr (std::is_same_v<T, Variant>)
    {
        return value;
    }
    else if constexpr (detail::is_optional<T>::value)
    {
        // null is a valid value for a nullable type: an engaged result holding an empty optional
        if (value.isNull())
            return std::optional<T>(std::in_place);

        auto inner = coerce<typename T::value_type>(value);

        if (! inner)
            return std::nullopt;

        return std::optional<T>(std::in_place, std::move(*inner));
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        return detail::coerceToBoolean(value);
    }
    else if constexpr (std::is_integral_v<T>)
    {
        auto i = detail::coerceToInteger(value, std::numeric_limits<T>::min(), std::numeric_limits<T>::max());

        if (! i)
            return std::nullopt;

        return static_cast<T>(*i);
    }
    else if constexpr (std::is_floating_point_v<T>)
    {
        auto r = detail::coerceToReal(value);

        if (! r)
            return std::nullopt;

        if constexpr (std::is_same_v<T, float>)
        {
            if (std::isfinite(*r) && std::fabs(*r) > static_cast<double>(std::numeric_limits<float>::max()))
                return std::nullopt;
        }

        return static_cast<T>(*r);
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
        return detail::coerceToString(value);
    }
    else if constexpr (std::is_same_v<T, Timestamp>)
    {
        return detail::coerceToTimestamp(value);
    }
    else if constexpr (std::is_same_v<T, Mapping>)
    {
        if (auto const* mapping = std::get_if<Mapping>(&value))
            return *mapping;

        return std::nullopt;
    }
    else
    {
        static_assert(detail::always_false<T>, "no coercion to this type");
    }
}

//=============================================================================
// Value implementations
//=============================================================================
template <typename T>
constexpr bool Value::isOpaque()
{
    if constexpr (std::is_aggregate_v<T>)
        return detail::num_fields<T>() == 0;

    return true;
}

//=============================================================================
// Object implementations
//=============================================================================
auto Object::operator()(this auto&& self, std::string_view fldname)
    -> std::conditional_t<std::is_const_v<std::remove_reference_t<decltype(self)>>,
                          Value const&,
                          Value&>
{
    auto flds = self.typeErasedFields();
    auto it = std::find_if(flds.begin(), flds.end(), [&fldname] (auto const& fld) { return fld.get().fieldname() == fldname; });

    if (it == flds.end()) // no field with this name?
        return Value::kInvalid;

    return it->get();
}

//=============================================================================
// Fundamental implementations
//=============================================================================

template <typename T>
Fundamental<T>::Fundamental() : underlying() { }

template <typename T>
Fundamental<T>::Fundamental(T underlying_) : underlying(std::move(underlying_)) {}

template <typename T>
Fundamental<T>::Fundamental(Fundamental const& o) : Base(o), underlying(o.underlying) {}

template <typename T>
Fundamental<T>::Fundamental(Fundamental&& o) : Base(std::move(o)), underlying(std::move(o.underlying)) {}

template <typename T>
MetaType const& Fundamental<T>::meta()
{
    return metaTypeOf<T>();
}

template <typename T>
MetaType const& Fundamental<T>::metaType() const
{
    return meta();
}

template <typename T>
Fundamental<T>& Fundamental<T>::operator=(T const& newValue)
{
    set(newValue);
    return *this;
}

template <typename T>
Fundamental<T>& Fundamental<T>::operator=(Fundamental const& newValue)
{
    set(newValue.underlying);
    return *this;
}

template <typename T>
Fundamental<T>& Fundamental<T>::operator=(Fundamental && newValue)
{
    set(std::move(newValue.underlying));
    return *this;
}

template <typename T>
void Fundamental<T>::set(T const& newValue)
{
    underlying = newValue;
}

template <typename T>
void Fundamental<T>::set(T && newValue)
{
    underlying = std::move(newValue);
}

template <typename T>
Variant Fundamental<T>::toVariant() const
{
    if constexpr (kIsOpaque)
        return Variant(underlying);
    else
        return Object::toVariant();
}

template <typename T>
bool Fundamental<T>::assign(Variant const& newValue, Policy policy)
{
    if constexpr (kIsOpaque)
    {
        auto coerced = coerce<T>(newValue);

        if (! coerced)
            return false;

        set(std::move(*coerced));
        return true;
    }
    else
    {
        auto const* mapping = std::get_if<Mapping>(&newValue);

        if (mapping == nullptr)
            return false;

        // apply to a scratch copy so that a failing strict application leaves this record untouched
        Record<T> scratch(underlying);

        if (! scratch.applyMapping(*mapping, policy))
            return false;

        set(scratch());
        return true;
    }
}

template <typename T>
void Fundamental<T>::reset()
{
    set(T{});
}

template <typename T>
std::unique_ptr<Value> Fundamental<T>::clone() const
{
    return std::make_unique<detail::BaseTypeFor<T>>(underlying);
}

//=============================================================================
// operator""_fld implementation
//=============================================================================
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#ifdef __clang__
#    pragma GCC diagnostic ignored "-Wgnu-string-literal-operator-template"
#endif
template <typename T, T... chars>
constexpr CompileTimeString<fixstr::fixed_string<sizeof...(chars)>({chars...})> operator""_fld()
{
    return { };
}
#pragma GCC diagnostic pop

//=============================================================================
// Record implementations
//=============================================================================

template <typename T>
auto Record<T>::fields_with(T& u)
{
    return detail::filter_tuple<detail::is_field>(boost::pfr::structure_tie(u));
}

template <typename T>
auto Record<T>::fields_with(T const& u)
{
    return detail::filter_tuple<detail::is_field>(boost::pfr::structure_tie(u));
}

template <typename T>
Record<T>::Record() : Fundamental<T>() {}

template <typename T>
Record<T>::Record(T const& underlying_) : Fundamental<T>(underlying_) {}

template <typename T>
Record<T>::Record(Record const& o) : Fundamental<T>(o.underlying) {}

template <typename T>
Record<T>::Record(Record&& o) : Fundamental<T>(std::move(o.underlying)) {}

template <typename T>
Record<T>& Record<T>::operator=(Record const& o)
{
    Fundamental<T>::operator=(o);
    return *this;
}

template <typename T>
Record<T>& Record<T>::operator=(Record&& o)
{
    Fundamental<T>::operator=(std::move(o));
    return *this;
}

template <typename T>
template <fixstr::fixed_string FieldName>
auto&& Record<T>::operator()(this auto& self, CompileTimeString<FieldName>)
{
    return std::apply([] <typename... Types> (Types &&... fields) -> auto&&
    {
        return detail::FindFieldHelper<FieldName>::eval(std::forward<Types>(fields)...);
    }, self.fields());
}

template <typename T>
auto Record<T>::fields(this auto& self)
{
    return fields_with(self.underlying);
}

template <typename T>
std::vector<std::reference_wrapper<Value const>> Record<T>::typeErasedFields() const
{
    return typeErasedFields_internal();
}

template <typename T>
std::vector<std::reference_wrapper<Value>> Record<T>::typeErasedFields()
{
    return typeErasedFields_internal();
}

template <typename T>
template <typename Lambda>
void Record<T>::visitFields(this auto& self, Lambda && lambda)
{
    std::apply([&lambda] <typename... Types> (Types &&... fields)
    {
        (lambda(std::string_view(std::remove_cvref_t<Types>::kName), fields), ...);
    }, self.fields());
}

template <typename T>
template <typename Lambda>
auto Record<T>::visitField(this auto& self, std::string_view const& str, Lambda && lambda)
{
    static constexpr auto kIsConst = std::is_const_v<std::remove_reference_t<decltype(self)>>;
    using FirstTupleElement = std::tuple_element_t<0, FieldsAsTuple>;
    using LambdaReturnType = std::invoke_result_t<Lambda, std::conditional_t<kIsConst, FirstTupleElement const&, FirstTupleElement&>>;
    static constexpr auto kLambdaReturnsVoid = std::is_same_v<LambdaReturnType, void>;

    using ReturnType = std::conditional_t<kLambdaReturnsVoid, bool, std::optional<LambdaReturnType>>;

    ReturnType returnValue = {};

    std::apply([&lambda, &str, &returnValue] <typename... Types> (Types &&... fields)
    {
        (std::invoke([&lambda, &str, &returnValue] (auto& fld)
        {
            if ((! returnValue) && std::string_view(std::remove_cvref_t<decltype(fld)>::kName) == str)
            {
                if constexpr (kLambdaReturnsVoid)
                {
                    returnValue = true;
                    lambda(fld);
                }
                else
                {
                    returnValue = lambda(fld);
                }
            }
        }, fields), ...);
    }, self.fields());

    return returnValue;
}

template <typename T>
auto Record<T>::typeErasedFields_internal(this auto& self)
{
    static constexpr auto kIsConst = std::is_const_v<std::remove_reference_t<decltype(self)>>;
    using ElementType = std::conditional_t<kIsConst, Value const, Value>;
    std::vector<std::reference_wrapper<ElementType>> returnValue;

    std::apply([&returnValue] <typename... Fields> (Fields && ...flds) mutable
    {
         (returnValue.emplace_back(static_cast<ElementType&>(flds)), ...);
    }, self.fields());

    return returnValue;
}

//=============================================================================
// Field implementations
//=============================================================================

template <typename T, fixstr::fixed_string Name, Access kAccess>
Field<T, Name, kAccess>& Field<T, Name, kAccess>::operator=(T const& t)
{
    Base::operator=(t);
    return *this;
}

template <typename T, fixstr::fixed_string Name, Access kAccess>
Field<T, Name, kAccess>& Field<T, Name, kAccess>::operator=(T && t)
{
    Base::operator=(std::move(t));
    return *this;
}

template <typename T, fixstr::fixed_string Name, Access kAccess>
std::string Field<T, Name, kAccess>::fieldname() const
{
    return std::string(std::string_view(Name));
}

//=============================================================================
// MetaType implementations
//=============================================================================

template <typename T>
MetaType const& metaTypeOf()
{
    if constexpr (Value::isOpaque<T>())
    {
        static detail::FundamentalMeta<T> const meta;
        return meta;
    }
    else
    {
        static detail::RecordMeta<T> const meta;
        return meta;
    }
}

} // namespace fieldkit

//=============================================================================
// std::formatter implementations
//=============================================================================

inline auto std::formatter<fieldkit::Value>::format(fieldkit::Value const& v, format_context& ctx) const
{
    std::ostringstream ss;
    ss << v;
    return std::formatter<string>::format(ss.str(), ctx);
}
