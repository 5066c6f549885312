#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include <compgroup/schema/classify.hpp>

namespace compgroup
{
	/*
	 * the ordered, classified fields of one record. field order is the record's
	 * declaration order and is what every synthesized operation iterates in.
	 * the views inside each `ClassifiedField` refer to the text of the `FieldSpec`s
	 * the schema was built from, which must outlive it
	 */
	class GroupSchema
	{
	public:
		/* classifies every field; throws `SchemaError` for an empty list or a repeated name */
		static GroupSchema from_fields(std::string record, const std::vector<FieldSpec>& fields);

		[[nodiscard]] const std::string& record() const;

		[[nodiscard]] const std::vector<ClassifiedField>& fields() const;

		[[nodiscard]] std::size_t size() const;

		[[nodiscard]] std::size_t required_count() const;

		[[nodiscard]] std::size_t optional_count() const;

		[[nodiscard]] const ClassifiedField* find(std::string_view name) const;

		void dump(std::ostream& os) const;

	private:
		GroupSchema(std::string record, std::vector<ClassifiedField> fields);

		std::string name;
		std::vector<ClassifiedField> classified;
	};
}
