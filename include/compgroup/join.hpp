#pragma once

#include <cstddef>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>
#include <compgroup/storage.hpp>

namespace compgroup
{
	/* hard filter: an entity matches only if the storage has its component */
	template<typename S>
	struct Required
	{
		using value_type = typename S::value_type;
		using item_type = const value_type&;
		static constexpr bool filters = true;

		const S* storage;

		const value_type* fetch(const Entity e) const
		{
			return storage->get(e);
		}

		static item_type yield(const value_type* value)
		{
			return *value;
		}
	};

	/* soft filter: never excludes a candidate, yields null when the component is absent */
	template<typename S>
	struct Maybe
	{
		using value_type = typename S::value_type;
		using item_type = const value_type*;
		static constexpr bool filters = false;

		const S* storage;

		const value_type* fetch(const Entity e) const
		{
			return storage->get(e);
		}

		static item_type yield(const value_type* value)
		{
			return value;
		}
	};

	template<typename S>
	Required<S> required(const S& storage)
	{
		return { &storage };
	}

	template<typename S>
	Maybe<S> maybe(const S& storage)
	{
		return { &storage };
	}

	/* parts point at their storage; a temporary handle would be gone before the join runs */
	template<typename S>
	void required(const S&&) = delete;

	template<typename S>
	void maybe(const S&&) = delete;

	/*
	 * intersection of storages over the live entities of a world. candidates are
	 * visited in the order of the `EntitiesView`, so two joins over the same unchanged
	 * world produce the same sequence
	 */
	template<typename... Parts>
	class Join
	{
	public:
		using item_type = std::tuple<Entity, typename Parts::item_type...>;

		Join(const EntitiesView& entities, Parts... parts) : entities(&entities), parts(parts...) {}
		Join(const EntitiesView&&, Parts...) = delete;

		std::optional<item_type> next()
		{
			while (cursor < entities->size())
			{
				const Entity candidate = (*entities)[cursor++];
				if (auto item = match(candidate, std::index_sequence_for<Parts...> {}))
					return item;
			}
			return std::nullopt;
		}

		/* every remaining match */
		std::vector<item_type> collect()
		{
			std::vector<item_type> items;
			while (auto item = next())
				items.emplace_back(std::move(*item));
			return items;
		}

	private:
		template<std::size_t... I>
		std::optional<item_type> match(const Entity candidate, std::index_sequence<I...>) const
		{
			const auto found = std::make_tuple(std::get<I>(parts).fetch(candidate)...);
			if (!((!Parts::filters || std::get<I>(found) != nullptr) && ...))
				return std::nullopt;

			return item_type(candidate, Parts::yield(std::get<I>(found))...);
		}

		const EntitiesView* entities;
		std::tuple<Parts...> parts;
		std::size_t cursor = 0;
	};

	template<typename... Parts>
	Join<Parts...> join(const EntitiesView& entities, Parts... parts)
	{
		return Join<Parts...>(entities, parts...);
	}

	template<typename... Parts>
	void join(const EntitiesView&&, Parts...) = delete;
}
