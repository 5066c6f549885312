#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>
#include <compgroup/types.hpp>

namespace compgroup
{
	class World;

	/* one granted borrow of a component storage; released when the token dies */
	class Borrow
	{
	public:
		Borrow() = default;

		Borrow(const World* world, std::uint64_t type, BorrowMode mode);

		~Borrow();

		Borrow(const Borrow&) = delete;

		Borrow& operator=(const Borrow&) = delete;

		Borrow(Borrow&& other) noexcept;

		Borrow& operator=(Borrow&& other) noexcept;

		[[nodiscard]] BorrowMode mode() const;

	private:
		void release();

		const World* world = nullptr;
		std::uint64_t type = 0;
		BorrowMode borrow_mode = BorrowMode::READ;
	};

	/* shared access to the `T` storage of a world, obtained from `World::read_storages` */
	template<typename T>
	class ReadStorage
	{
	public:
		using value_type = T;

		ReadStorage(const World* world, Borrow borrow);

		[[nodiscard]] const T* get(Entity e) const;

		[[nodiscard]] bool contains(Entity e) const;

	private:
		const World* world;
		Borrow borrow;
	};

	/* exclusive access to the `T` storage of a world, obtained from `World::write_storages` */
	template<typename T>
	class WriteStorage
	{
	public:
		using value_type = T;

		WriteStorage(World* world, Borrow borrow);

		[[nodiscard]] T* get(Entity e) const;

		[[nodiscard]] bool contains(Entity e) const;

		/* inserts or overwrites; fails with `StorageErrc::dead_entity` for entities that are not alive */
		[[nodiscard]] std::error_code insert(Entity e, T value);

		/* detaches the component and hands back its value; absence is not an error */
		std::optional<T> remove(Entity e);

	private:
		World* world;
		Borrow borrow;
	};

	/*
	 * snapshot of the live entities of a world, ordered by entity index. the order is
	 * the world's iteration guarantee: it is stable for as long as the world is not
	 * structurally modified and joins enumerate candidates in this order
	 */
	class EntitiesView
	{
	public:
		using const_iterator = std::vector<Entity>::const_iterator;

		explicit EntitiesView(std::vector<Entity> entities);

		[[nodiscard]] const_iterator begin() const;

		[[nodiscard]] const_iterator end() const;

		[[nodiscard]] std::size_t size() const;

		[[nodiscard]] bool empty() const;

		[[nodiscard]] bool contains(Entity e) const;

		Entity operator[](std::size_t index) const;

	private:
		std::vector<Entity> alive;
	};

	class EntityBuilder
	{
	public:
		EntityBuilder(World* world, Entity entity);

		template<typename T>
		EntityBuilder& attach(const T& component);

		[[nodiscard("the built entity should not be discarded")]]
		Entity finish() const;

	private:
		World* world;
		Entity entity;
	};
}
