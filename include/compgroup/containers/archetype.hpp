#pragma once

#include <ostream>
#include <unordered_map>
#include <vector>
#include <compgroup/types.hpp>
#include <compgroup/containers/column.hpp>

namespace compgroup
{
	struct Archetype;

	struct GraphEdge
	{
		Archetype* from;
		Archetype* to;
		Component id; /* what component causes the transition */
	};

	struct Record
	{
		Archetype* archetype = nullptr;
	};

	/* every entity stored here carries exactly `components`; entities are raw ids */
	struct Archetype
	{
		/* graph structure */
		std::unordered_map<Component, GraphEdge*> add_edge;
		std::unordered_map<Component, GraphEdge*> remove_edge;

		std::unordered_map<Entity, size_t> entity_rows;
		std::unordered_map<Component, Column> columns;
		std::vector<Component> components;
		std::vector<Entity> entities;
		size_t entity_count = 0;
		uint64_t id = 0;

		[[nodiscard]] bool has(Component c) const;

		[[nodiscard]] size_t row_of(Entity entity) const;

		size_t append(Entity entity);

		void remove(Entity entity);

		void dump(std::ostream& os) const;
	};
}
