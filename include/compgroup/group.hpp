#pragma once

#include <cstddef>
#include <optional>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>
#include <compgroup/join.hpp>
#include <compgroup/world.hpp>
#include <compgroup/base/errors.hpp>
#include <compgroup/base/utils.hpp>
#include <compgroup/schema/field.hpp>
#include <compgroup/schema/group_schema.hpp>

namespace compgroup
{
	template<typename R, typename List = schema_of_t<R>>
	class Group;

	/*
	 * the group protocol of a record type `R`, synthesized from its schema. every
	 * operation is a fold over the record's fields in declaration order; required
	 * and optional fields differ only in the fragment each operation runs for them.
	 *
	 * storage is borrowed once per call, as a single batch holding one handle per
	 * field: read handles for `first_match`, `load`, `exactly_one` and `all`, write
	 * handles for `update` and `remove`. `create` goes through the entity builder
	 */
	template<typename R, typename... F>
	class Group<R, FieldList<R, F...>>
	{
		static_assert(std::is_class_v<R> && !std::is_union_v<R>, "only structs with named fields are supported");
		static_assert(std::is_aggregate_v<R>, "a component group record must be a plain aggregate");
		static_assert(sizeof...(F) > 0, "a record must have at least one field to form a component group");
		static_assert(schema_status<R>() != SchemaStatus::duplicate_field, "field names of a component group must be unique");
		static_assert(schema_status<R>() != SchemaStatus::field_mismatch,
		              "the listed fields must cover every member of the record in declaration order");
		static_assert((std::is_copy_constructible_v<typename F::payload_type> && ...),
		              "component group fields must be copyable");

		using indices = std::index_sequence_for<F...>;

	public:
		using record_type = R;

		/* the first entity, in join order, carrying every required component */
		static std::optional<std::pair<Entity, R>> first_match(const World& world)
		{
			const auto storages = world.read_storages<typename F::payload_type...>();
			const EntitiesView entities = world.entities();

			auto matches = join_over(entities, storages, indices {});
			const auto item = matches.next();
			if (!item)
				return std::nullopt;

			return std::make_pair(std::get<0>(*item), from_item(*item, indices {}));
		}

		/* `entity` must carry every required component; `MissingComponentError` otherwise */
		static R load(const World& world, const Entity entity)
		{
			const auto storages = world.read_storages<typename F::payload_type...>();
			return load_fields(storages, entity, indices {});
		}

		/* optional fields that are empty are never attached */
		static Entity create(R record, World& world)
		{
			EntityBuilder builder = world.create_entity();
			(attach<F>(builder, record), ...);
			return builder.finish();
		}

		/*
		 * overwrites the group's components of `entity` and leaves every other component
		 * alone. stops at the first required field whose insertion fails and returns that
		 * error; fields before it have already been written
		 */
		[[nodiscard]]
		static UpdateError update(R record, World& world, const Entity entity)
		{
			auto storages = world.write_storages<typename F::payload_type...>();
			return update_fields(record, storages, entity, indices {});
		}

		/* detaches the group's components and returns them; other components stay */
		static R remove(World& world, const Entity entity)
		{
			auto storages = world.write_storages<typename F::payload_type...>();
			return take_fields(storages, entity, indices {});
		}

		/* the only match, or `LookupErrc::no_match` / `LookupErrc::ambiguous` in `ec` */
		static std::optional<R> exactly_one(const World& world, std::error_code& ec)
		{
			const auto storages = world.read_storages<typename F::payload_type...>();
			const EntitiesView entities = world.entities();

			auto matches = join_over(entities, storages, indices {});
			const auto first = matches.next();
			if (!first)
			{
				ec = LookupErrc::no_match;
				return std::nullopt;
			}

			if (matches.next())
			{
				ec = LookupErrc::ambiguous;
				return std::nullopt;
			}

			ec.clear();
			return from_item(*first, indices {});
		}

		static R exactly_one(const World& world)
		{
			std::error_code ec;
			std::optional<R> record = exactly_one(world, ec);
			if (ec)
				throw LookupError(ec, schema().record());
			return std::move(*record);
		}

		/* every match, in join order */
		static std::vector<std::pair<Entity, R>> all(const World& world)
		{
			const auto storages = world.read_storages<typename F::payload_type...>();
			const EntitiesView entities = world.entities();

			std::vector<std::pair<Entity, R>> groups;
			auto matches = join_over(entities, storages, indices {});
			while (const auto item = matches.next())
				groups.emplace_back(std::get<0>(*item), from_item(*item, indices {}));
			return groups;
		}

		static const GroupSchema& schema()
		{
			static const GroupSchema group_schema = GroupSchema::from_fields(type_name<R>(), { F::spec... });
			return group_schema;
		}

	private:
		template<std::size_t I>
		using field_at = std::tuple_element_t<I, std::tuple<F...>>;

		template<typename Storages, std::size_t... I>
		static auto join_over(const EntitiesView& entities, const Storages& storages, std::index_sequence<I...>)
		{
			return join(entities, part<field_at<I>>(std::get<I>(storages))...);
		}

		template<typename Field, typename S>
		static auto part(const S& storage)
		{
			if constexpr (Field::is_optional)
				return maybe(storage);
			else
				return required(storage);
		}

		template<typename Item, std::size_t... I>
		static R from_item(const Item& item, std::index_sequence<I...>)
		{
			return R { clone<F>(std::get<I + 1>(item))... };
		}

		template<typename Field, typename Value>
		static typename Field::member_type clone(const Value& value)
		{
			if constexpr (Field::is_optional)
			{
				/* the join yields a pointer that is null when the component is absent */
				if (value)
					return typename Field::member_type(*value);
				return typename Field::member_type {};
			}
			else
			{
				return value;
			}
		}

		template<typename Storages, std::size_t... I>
		static R load_fields(const Storages& storages, const Entity entity, std::index_sequence<I...>)
		{
			return R { load_field<F>(std::get<I>(storages), entity)... };
		}

		template<typename Field, typename S>
		static typename Field::member_type load_field(const S& storage, const Entity entity)
		{
			const auto* value = storage.get(entity);
			if constexpr (Field::is_optional)
			{
				if (value)
					return typename Field::member_type(*value);
				return typename Field::member_type {};
			}
			else
			{
				if (!value)
					throw MissingComponentError(Field::classified.payload_type, entity);
				return *value;
			}
		}

		template<typename Field>
		static void attach(EntityBuilder& builder, R& record)
		{
			auto& value = Field::access(record);
			if constexpr (Field::is_optional)
			{
				if (value)
					builder.attach(*value);
			}
			else
			{
				builder.attach(value);
			}
		}

		template<typename Storages, std::size_t... I>
		static UpdateError update_fields(R& record, Storages& storages, const Entity entity, std::index_sequence<I...>)
		{
			UpdateError error;
			/* `&&` evaluates left to right and stops at the first failure */
			static_cast<void>(((error = update_field<F>(std::get<I>(storages), record, entity), !error) && ...));
			return error;
		}

		template<typename Field, typename S>
		static UpdateError update_field(S& storage, R& record, const Entity entity)
		{
			auto& value = Field::access(record);
			if constexpr (Field::is_optional)
			{
				if (!value)
				{
					/* absent already is fine; removing is idempotent */
					storage.remove(entity);
					return {};
				}
				return storage.insert(entity, std::move(*value));
			}
			else
			{
				return storage.insert(entity, std::move(value));
			}
		}

		template<typename Storages, std::size_t... I>
		static R take_fields(Storages& storages, const Entity entity, std::index_sequence<I...>)
		{
			return R { take_field<F>(std::get<I>(storages), entity)... };
		}

		template<typename Field, typename S>
		static typename Field::member_type take_field(S& storage, const Entity entity)
		{
			auto value = storage.remove(entity);
			if constexpr (Field::is_optional)
			{
				if (value)
					return typename Field::member_type(std::move(*value));
				return typename Field::member_type {};
			}
			else
			{
				if (!value)
					throw MissingComponentError(Field::classified.payload_type, entity);
				return std::move(*value);
			}
		}
	};
}
