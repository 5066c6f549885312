#include <algorithm>
#include <stdexcept>
#include <string>
#include <compgroup/containers/archetype.hpp>

namespace compgroup
{
	size_t Archetype::append(const Entity entity)
	{
		const size_t row = entity_count++;
		if (row >= entities.size())
		{
			const size_t newsz = entities.empty() ? 16 : entities.size() * 2;
			entities.resize(newsz);
			for (auto &[comp_id, column]: columns)
				column.resize(newsz);
		}

		entities[row] = entity;
		entity_rows[entity] = row;
		return row;
	}

	bool Archetype::has(const Component c) const
	{
		return std::ranges::find(components, c) != components.end();
	}

	size_t Archetype::row_of(const Entity entity) const
	{
		const auto it = entity_rows.find(entity);
		if (it == entity_rows.end())
			throw std::out_of_range("entity " + std::to_string(entity) + " is not stored in archetype " + std::to_string(id));
		return it->second;
	}

	void Archetype::remove(const Entity entity)
	{
		const auto it = entity_rows.find(entity);
		if (it == entity_rows.end())
			return;

		const size_t row = it->second;
		const size_t last_row = entity_count - 1;

		if (row != last_row)
		{
			/* move the last entity to this row; O(1) for appending last */
			const Entity last_entity = entities[last_row];
			for (auto &[comp_id, column]: columns)
				column.relocate(row, last_row);

			entities[row] = last_entity;
			entity_rows[last_entity] = row;
		}
		else
		{
			/* if we're removing the last entity, just destroy its components */
			for (auto &[comp_id, column]: columns)
				column.destroy_at(row);
		}

		entity_count--;
		entity_rows.erase(entity);
		entities[last_row] = 0;
	}

	void Archetype::dump(std::ostream& os) const
	{
		os << "archetype dump:\n";
		os << "  id: " << id << "\n";
		os << "  entity count: " << entity_count << "\n";

		os << "  existing components:\n";
		for (const auto comp : components)
			os << "    " << comp << "\n";

		os << "  entities:\n";
		for (size_t i = 0; i < entity_count; ++i)
			os << "    [" << i << "]: " << entities[i] << "\n";

		os << "  columns:\n";
		for (const auto& [comp, column] : columns)
		{
			os << "    component " << comp
			   << " (capacity: " << column.capacity()
			   << ", constructed rows: ";

			for (size_t i = 0; i < column.capacity(); ++i)
			{
				if (column.is_constructed(i))
					os << i << " ";
			}
			os << ")\n";
		}
	}
}
