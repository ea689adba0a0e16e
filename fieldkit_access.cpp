#include "fieldkit_access.hpp"

#include <iterator>

namespace fieldkit
{
namespace
{
class StandardTranscoder : public Transcoder
{
public:
    Mapping encode(Value const& source) const override
    {
        return toMapping(source);
    }

    bool decode(Mapping const& mapping, Value& target) const override
    {
        if (! detail::isPresentRecord(target))
            return false;

        return static_cast<Object&>(target).applyMapping(mapping, Policy::strict);
    }
};

std::unique_ptr<Value> constructRecord(MetaType const& targetType)
{
    if (! targetType.isRecord())
        return nullptr;

    auto target = targetType.construct();

    if (target == nullptr || ! detail::isPresentRecord(*target))
        return nullptr;

    return target;
}
} // namespace

namespace detail
{
void copyInto(Value const& source, Value& target, FieldNames const& names)
{
    for (auto const& name : names)
        setField(target, name, getField(source, name));
}
} // namespace detail

bool hasField(Value const& record, std::string_view name)
{
    return detail::isPresentRecord(record) && static_cast<Object const&>(record)(name).isValid();
}

std::expected<Variant, AccessError> tryGetField(Value const& record, std::string_view name)
{
    if (! detail::isPresentRecord(record))
        return std::unexpected(AccessError::absentRecord);

    auto const& fld = static_cast<Object const&>(record)(name);

    if (! fld)
        return std::unexpected(AccessError::unknownField);

    if (! fld.isReadable())
        return std::unexpected(AccessError::notReadable);

    return fld.toVariant();
}

std::expected<void, AccessError> trySetField(Value& record, std::string_view name, Variant const& value)
{
    if (! detail::isPresentRecord(record))
        return std::unexpected(AccessError::absentRecord);

    return static_cast<Object&>(record).assignField(name, value, Policy::lenient);
}

bool setField(Value& record, std::string_view name, Variant const& value)
{
    return trySetField(record, name, value).has_value();
}

Mapping toMapping(Value const& record)
{
    if (! detail::isPresentRecord(record))
        return {};

    return static_cast<Object const&>(record).toMapping();
}

FieldNames readableFieldNames(Value const& record)
{
    FieldNames names;

    if (! detail::isPresentRecord(record))
        return names;

    for (auto const& fld : static_cast<Object const&>(record).typeErasedFields())
    {
        if (fld.get().isReadable())
            names.push_back(fld.get().fieldname());
    }

    return names;
}

std::unique_ptr<Value> fromMapping(Mapping const& mapping, MetaType const& targetType)
{
    auto target = constructRecord(targetType);

    if (target == nullptr)
        return nullptr;

    auto const applied = static_cast<Object&>(*target).applyMapping(mapping, Policy::lenient);
    assert(applied); // lenient application does not fail
    (void)applied;

    return target;
}

Transcoder const& Transcoder::standard()
{
    static StandardTranscoder const transcoder;
    return transcoder;
}

std::unique_ptr<Value> convertTo(Value const& source, MetaType const& targetType, Transcoder const& transcoder)
{
    if (! detail::isPresentRecord(source) || ! targetType.isRecord())
        return nullptr;

    if (source.type() == targetType.typeInfo())
        return source.clone();

    auto target = constructRecord(targetType);

    if (target == nullptr || ! transcoder.decode(transcoder.encode(source), *target))
        return nullptr;

    return target;
}

std::unique_ptr<Value> copyFields(Value const& source, MetaType const& targetType, FieldNames const& names)
{
    if (! detail::isPresentRecord(source) || names.empty())
        return nullptr;

    auto target = constructRecord(targetType);

    if (target == nullptr)
        return nullptr;

    detail::copyInto(source, *target, names);
    return target;
}

std::unique_ptr<Value> copyAllFields(Value const& source, MetaType const& targetType)
{
    return copyFields(source, targetType, readableFieldNames(source));
}

void clearFields(Value& record, FieldNames const& names)
{
    for (auto const& name : names)
        setField(record, name, Variant());
}

void resetFields(Value& record, FieldNames const& names)
{
    if (! detail::isPresentRecord(record))
        return;

    auto& object = static_cast<Object&>(record);

    for (auto const& name : names)
    {
        auto& fld = object(name);

        if (fld && fld.isWritable())
            fld.reset();
    }
}

bool fieldsEqual(Value const& a, Value const& b, FieldNames const& names)
{
    if (! detail::isPresentRecord(a) || ! detail::isPresentRecord(b))
        return false;

    return std::all_of(names.begin(), names.end(), [&a, &b] (auto const& name)
    {
        return getField(a, name) == getField(b, name);
    });
}

FieldNames changedFields(Value const& original, Value const& current, FieldNames const& names)
{
    FieldNames changed;

    if (! detail::isPresentRecord(original) || ! detail::isPresentRecord(current))
        return changed;

    std::copy_if(names.begin(), names.end(), std::back_inserter(changed), [&original, &current] (auto const& name)
    {
        return ! (getField(original, name) == getField(current, name));
    });

    return changed;
}

} // namespace fieldkit
