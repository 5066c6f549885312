#include <algorithm>
#include <compgroup/base/errors.hpp>
#include <compgroup/schema/group_schema.hpp>

namespace compgroup
{
    namespace
    {
        std::string location(const SourceSpan &span)
        {
            if (span.file.empty())
                return {};
            return " (" + std::string(span.file) + ":" + std::to_string(span.line) + ")";
        }
    }

    GroupSchema::GroupSchema(std::string record, std::vector<ClassifiedField> fields) :
        name(std::move(record)), classified(std::move(fields)) {}

    GroupSchema GroupSchema::from_fields(std::string record, const std::vector<FieldSpec> &fields)
    {
        if (fields.empty())
            throw SchemaError(record + ": a record must have at least one field to form a component group");

        std::vector<ClassifiedField> classified;
        classified.reserve(fields.size());
        for (const FieldSpec &field : fields)
        {
            if (field.name.empty())
                throw SchemaError(record + ": only records with named fields are supported" + location(field.span));

            if (std::ranges::any_of(classified, [&](const ClassifiedField &seen) { return seen.name == field.name; }))
            {
                throw SchemaError(record + ": duplicate field `" + std::string(field.name) + "`" +
                                  location(field.span));
            }

            classified.emplace_back(classify(field));
        }

        return { std::move(record), std::move(classified) };
    }

    const std::string &GroupSchema::record() const
    {
        return name;
    }

    const std::vector<ClassifiedField> &GroupSchema::fields() const
    {
        return classified;
    }

    std::size_t GroupSchema::size() const
    {
        return classified.size();
    }

    std::size_t GroupSchema::required_count() const
    {
        return size() - optional_count();
    }

    std::size_t GroupSchema::optional_count() const
    {
        return static_cast<std::size_t>(std::ranges::count_if(classified, &ClassifiedField::is_optional));
    }

    const ClassifiedField *GroupSchema::find(const std::string_view field) const
    {
        const auto it = std::ranges::find(classified, field, &ClassifiedField::name);
        return it == classified.end() ? nullptr : &*it;
    }

    void GroupSchema::dump(std::ostream &os) const
    {
        os << "group schema dump:\n";
        os << "  record: " << name << "\n";
        os << "  fields:\n";
        for (const ClassifiedField &field : classified)
        {
            os << "    " << field.name << ": " << field.payload_type
               << (field.is_optional ? " (optional)" : " (required)") << location(field.span) << "\n";
        }
    }
}
