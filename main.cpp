#include <chrono>
#include <format>
#include <iostream>
#include "fieldkit_query.hpp"
#include "operation_result.hpp"

// Example usage: a small in-memory user directory
using namespace fieldkit;

struct User
{
    ReadOnlyField<std::int64_t, "Id">                 id;
    Field<std::string, "Name">                        name;
    Field<std::string, "Email">                       email;
    Field<std::optional<std::string>, "Description">  description;
    Field<Timestamp, "CreatedDate">                   createdDate;
    Field<std::optional<Timestamp>, "UpdatedDate">    updatedDate;
    Field<bool, "IsActive">                           isActive = true;
};

struct UserSummary
{
    Field<std::int64_t, "Id">     id;
    Field<std::string, "Name">    name;
    Field<std::string, "Email">   email;
    Field<bool, "IsActive">       isActive;
};

Timestamp now()
{
    return std::chrono::floor<std::chrono::microseconds>(std::chrono::system_clock::now());
}

class UserDirectory
{
public:
    OperationResult<Record<User>> create(Mapping const& input)
    {
        auto user = fromMapping<User>(input);

        if (getField<std::string>(*user, "Name").empty())
            return OperationResult<Record<User>>::failure("Name is required");

        (*user)("Id"_fld) = nextId++;
        (*user)("CreatedDate"_fld) = now();

        users.push_back(*user);
        std::cout << std::format("created user {}", *user) << std::endl;

        return OperationResult<Record<User>>::success(*user);
    }

    OperationResult<Record<User>> update(std::int64_t id, Mapping const& changes)
    {
        auto* user = find(id);

        if (user == nullptr)
            return OperationResult<Record<User>>::failure(std::format("no user with Id {}", id));

        auto updated = *user;
        OperationResult<Record<User>>::Errors errors;

        for (auto const& [name, value] : changes)
        {
            if (auto result = trySetField(updated, name, value); ! result)
                errors.push_back(std::format("{}: {}", name, result.error()));
        }

        if (! errors.empty())
            return OperationResult<Record<User>>::failure(std::move(errors));

        auto const changed = changedFields(*user, updated, readableFieldNames(updated));

        if (! changed.empty())
        {
            setField(updated, "UpdatedDate", now());

            for (auto const& name : changed)
                std::cout << std::format("user {} changed {}: {} -> {}", id, name, getField(*user, name), getField(updated, name)) << std::endl;
        }

        *user = updated;
        return OperationResult<Record<User>>::success(updated);
    }

    OperationResult<void> deactivate(std::int64_t id)
    {
        auto* user = find(id);

        if (user == nullptr)
            return OperationResult<void>::failure(std::format("no user with Id {}", id));

        setField(*user, "IsActive", false);
        return OperationResult<void>::success();
    }

    OperationResult<std::vector<Record<UserSummary>>> list(std::string_view search, std::string_view sortField, int pageNumber, int pageSize) const
    {
        auto matches = search.empty() ? users : whereFieldContains(users, "Name", search);
        matches = orderByField(matches, sortField);

        std::vector<Record<UserSummary>> summaries;
        for (auto const& user : page(matches, pageNumber, pageSize))
        {
            if (auto summary = copyAllFields<UserSummary>(user))
                summaries.push_back(std::move(*summary));
        }

        return OperationResult<std::vector<Record<UserSummary>>>::success(std::move(summaries), matches.size());
    }

private:
    Record<User>* find(std::int64_t id)
    {
        auto it = std::find_if(users.begin(), users.end(), [id] (auto const& user) { return user("Id"_fld)() == id; });
        return it != users.end() ? &*it : nullptr;
    }

    std::vector<Record<User>> users;
    std::int64_t nextId = 1;
};

void metaTypeExamples()
{
    std::cout << "\n=== MetaType Examples ===\n\n";

    // Inspect a Record type without creating an instance
    for (auto const& field : metaTypeOf<User>().fields())
    {
        std::cout << "  " << field.fieldname
                  << (field.metaType().isNullable() ? " (nullable)" : "")
                  << (field.isWritable() ? "" : " (read-only)") << "\n";
    }

    // Construct an instance via the MetaType factory and fill it by name
    auto instance = metaTypeOf<UserSummary>().construct();
    setField(*instance, "Name", "constructed");
    std::cout << "  Constructed: " << *instance << "\n";
}

int main()
{
    UserDirectory directory;

    for (auto const& name : { "Grace", "Ada", "Linus", "Barbara" })
    {
        auto result = directory.create({ { "Name", name },
                                         { "Email", std::format("{}@example.org", name) },
                                         { "Id", 999 } });

        if (! result)
            std::cout << result << std::endl;
    }

    std::cout << directory.create({ { "Email", "nobody@example.org" } }) << std::endl;

    auto updated = directory.update(2, { { "Email", "ada@lovelace.org" }, { "Description", "first programmer" } });
    std::cout << "update: " << updated << std::endl;

    auto rejected = directory.update(2, { { "Id", 7 }, { "CreatedDate", "yesterday" } });
    std::cout << "update: " << rejected << std::endl;

    std::cout << "deactivate: " << directory.deactivate(3) << std::endl;

    auto listing = directory.list("a", "Name", 1, 2);
    if (listing)
    {
        std::cout << std::format("page 1 of {}", totalPages(listing.totalCount(), 2)) << std::endl;

        for (auto const& summary : *listing.payload())
            std::cout << std::format("  {}", summary) << std::endl;
    }

    // A User converted to another shape keeps the fields both have in common
    if (auto summary = convertTo<UserSummary>(updated.payload().value()))
        std::cout << std::format("converted: {}", *summary) << std::endl;

    metaTypeExamples();

    return 0;
}
