#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <compgroup/schema/classify.hpp>
#include <compgroup/schema/fixed_string.hpp>

namespace compgroup
{
	/* the wrapper the classifier recognizes; spell optional fields as `Option<T>` */
	template<typename T>
	using Option = std::optional<T>;

	template<typename T>
	concept OptionalLike = std::default_initializable<T> && requires(T& t, const T& ct)
	{
		typename T::value_type;
		{ ct.has_value() } -> std::convertible_to<bool>;
		*t;
	};

	namespace detail
	{
		template<typename M, bool Optional>
		struct payload
		{
			using type = M;
		};

		template<typename M>
		struct payload<M, true>
		{
			static_assert(OptionalLike<M>, "a field spelled `Option<T>` must be declared with an optional wrapper");
			using type = typename M::value_type;
		};
	}

	template<auto Member, FixedString Name, FixedString Declared, typename DeclaredT>
	struct Field;

	/* one record member together with its name and the spelling of its declared type */
	template<typename R, typename M, M R::*Member, FixedString Name, FixedString Declared, typename DeclaredT>
	struct Field<Member, Name, Declared, DeclaredT>
	{
		static_assert(std::is_same_v<M, DeclaredT>, "the declared field type does not match the member type");

		using record_type = R;
		using member_type = M;

		static constexpr FieldSpec spec = { Name.view(), Declared.view() };
		static constexpr ClassifiedField classified = classify(spec);
		static constexpr bool is_optional = classified.is_optional;

		using payload_type = typename detail::payload<M, is_optional>::type;

		static M& access(R& record)
		{
			return record.*Member;
		}

		static const M& access(const R& record)
		{
			return record.*Member;
		}
	};

	template<typename R, typename... Fields>
	struct FieldList
	{
		using record_type = R;
		static constexpr std::size_t size = sizeof...(Fields);
	};

	/* found by argument-dependent lookup on the function the schema macros define */
	template<typename R>
	using schema_of_t = decltype(compgroup_schema(static_cast<const R*>(nullptr)));

	template<typename R>
	concept HasGroupSchema = requires { typename schema_of_t<R>; };

	enum class SchemaStatus
	{
		ok,
		not_a_struct,
		not_an_aggregate,
		no_fields,
		duplicate_field,
		field_mismatch
	};

	constexpr std::string_view describe(const SchemaStatus status)
	{
		switch (status)
		{
			case SchemaStatus::ok:
				return "ok";
			case SchemaStatus::not_a_struct:
				return "only structs with named fields are supported";
			case SchemaStatus::not_an_aggregate:
				return "a component group record must be a plain aggregate";
			case SchemaStatus::no_fields:
				return "a record must have at least one field to form a component group";
			case SchemaStatus::duplicate_field:
				return "field names of a component group must be unique";
			case SchemaStatus::field_mismatch:
				return "the listed fields must cover every member of the record in declaration order";
		}
		return "unknown";
	}

	namespace detail
	{
		template<typename R, typename... F>
		constexpr SchemaStatus list_status(FieldList<R, F...>)
		{
			if constexpr (sizeof...(F) == 0)
			{
				return SchemaStatus::no_fields;
			}
			else
			{
				constexpr std::array<std::string_view, sizeof...(F)> names = { F::spec.name... };
				for (std::size_t i = 0; i < names.size(); ++i)
				{
					for (std::size_t j = 0; j < i; ++j)
					{
						if (names[i] == names[j])
							return SchemaStatus::duplicate_field;
					}
				}

				/*
				 * records are rebuilt as `R { field... }`: the member types, in list order,
				 * must initialize the record and leave no member behind
				 */
				constexpr bool positional = requires { R { std::declval<typename F::member_type>()... }; };
				constexpr bool leftover = requires { R { std::declval<typename F::member_type>()..., {} }; };
				return positional && !leftover ? SchemaStatus::ok : SchemaStatus::field_mismatch;
			}
		}
	}

	/* the schema-definition checks `Group<R>` enforces, in the order it enforces them */
	template<typename R>
	constexpr SchemaStatus schema_status()
	{
		if constexpr (!std::is_class_v<R> || std::is_union_v<R>)
			return SchemaStatus::not_a_struct;
		else if constexpr (!std::is_aggregate_v<R>)
			return SchemaStatus::not_an_aggregate;
		else
			return detail::list_status(schema_of_t<R> {});
	}
}

#define COMPGROUP_DETAIL_MEMBER(name, ...) __VA_ARGS__ name;

#define COMPGROUP_DETAIL_FIELD(name, ...) \
	, ::compgroup::Field<&compgroup_record::name, #name, #__VA_ARGS__, __VA_ARGS__>

#define COMPGROUP_DETAIL_DESIGNATOR(name, ...) .name = std::declval<__VA_ARGS__>(),

#define COMPGROUP_DETAIL_UNPAREN(...) __VA_ARGS__

/* designators must name members in declaration order, which also catches same-typed swaps */
#define COMPGROUP_DETAIL_SCHEMA_BODY(FIELDS)                                      \
	static_assert([]<typename compgroup_r>(const compgroup_r*)                    \
	{                                                                             \
		if constexpr (std::is_aggregate_v<compgroup_r>)                           \
			return requires { compgroup_r { FIELDS(COMPGROUP_DETAIL_DESIGNATOR) }; }; \
		else                                                                      \
			return true;                                                          \
	}(static_cast<const compgroup_record*>(nullptr)),                             \
	"list the fields of a component group in declaration order");                 \
	return ::compgroup::FieldList<compgroup_record FIELDS(COMPGROUP_DETAIL_FIELD)> {};

/*
 * declares `struct Record` with one member per entry of the X-macro list `FIELDS`
 * and binds it to its schema:
 *
 *   #define PLAYER_FIELDS(FIELD)   \
 *       FIELD(position, Position)  \
 *       FIELD(animation, Option<Animation>)
 *
 *   COMPGROUP_DEFINE(Player, PLAYER_FIELDS);
 */
#define COMPGROUP_DEFINE(Record, FIELDS)                                            \
	struct Record                                                                   \
	{                                                                               \
		FIELDS(COMPGROUP_DETAIL_MEMBER)                                             \
                                                                                    \
		friend constexpr auto compgroup_schema(const Record*)                       \
		{                                                                           \
			using compgroup_record = Record;                                        \
			return ::compgroup::FieldList<Record FIELDS(COMPGROUP_DETAIL_FIELD)> {}; \
		}                                                                           \
	}

/*
 * binds an existing aggregate to a schema. expand it in the namespace of `Record`;
 * list every member once, in declaration order, with its type spelled as declared.
 * `schema_status` reports `field_mismatch` for lists that leave members out
 */
#define COMPGROUP_SCHEMA(Record, FIELDS)                                            \
	[[maybe_unused]] constexpr auto compgroup_schema(const Record*)                 \
	{                                                                               \
		using compgroup_record = Record;                                            \
		COMPGROUP_DETAIL_SCHEMA_BODY(FIELDS)                                        \
	}

/*
 * the same for a class template; both `PARAMS` and `Record` go in parentheses:
 *
 *   COMPGROUP_SCHEMA_TEMPLATE((typename T), (Equipped<T>), EQUIPPED_FIELDS)
 *
 * field types may name the parameters. every `Group<Equipped<X>>` checks its own
 * instantiation
 */
#define COMPGROUP_SCHEMA_TEMPLATE(PARAMS, Record, FIELDS)                           \
	template<COMPGROUP_DETAIL_UNPAREN PARAMS>                                       \
	constexpr auto compgroup_schema(const COMPGROUP_DETAIL_UNPAREN Record*)         \
	{                                                                               \
		using compgroup_record = COMPGROUP_DETAIL_UNPAREN Record;                    \
		COMPGROUP_DETAIL_SCHEMA_BODY(FIELDS)                                        \
	}
