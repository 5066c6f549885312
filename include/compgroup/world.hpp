#pragma once

#include <cstring>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>
#include <compgroup/types.hpp>
#include <compgroup/storage.hpp>
#include <compgroup/base/errors.hpp>
#include <compgroup/base/utils.hpp>
#include <compgroup/containers/archetype.hpp>

namespace compgroup
{
    class World
    {
    public:
        World();

        ~World();

        World(const World&) = delete;

        World& operator=(const World&) = delete;

        [[nodiscard("compgroup::Entity should not be discarded")]]
        Entity entity();

        /* allocates a fresh entity and returns a builder attaching components to it */
        [[nodiscard]]
        EntityBuilder create_entity();

        void despawn(Entity e);

        [[nodiscard]] bool is_alive(Entity e) const;

        [[nodiscard]] uint64_t alive() const;

        template<typename T>
        World* set(Entity e, const T& data);

        template<typename T>
        bool has(Entity e) const;

        template<typename T>
        T* get(Entity e);

        template<typename T>
        const T* get(Entity e) const;

        template<typename T>
        std::optional<T> remove(Entity e);

        /*
         * borrows every requested storage in one batch. the whole batch is checked
         * against outstanding borrows (and against itself) before anything is granted,
         * so a conflicting request throws `BorrowConflictError` and borrows nothing
         */
        template<typename... Ts>
        std::tuple<ReadStorage<Ts>...> read_storages() const;

        template<typename... Ts>
        std::tuple<WriteStorage<Ts>...> write_storages();

        template<typename T>
        ReadStorage<T> read_storage() const;

        template<typename T>
        WriteStorage<T> write_storage();

        [[nodiscard]] EntitiesView entities() const;

        void dump(std::ostream& os) const;

        /* utils */
        static Entity encode_entity(std::uint64_t eid, Generation egen);

        static std::uint64_t get_eid(Entity e);

        static Generation get_egen(Entity e);

    private:
        friend class Borrow;

        template<typename>
        friend class ReadStorage;

        template<typename>
        friend class WriteStorage;

        struct BorrowState
        {
            std::uint32_t readers = 0;
            bool writer = false;
        };

        struct BorrowRequest
        {
            std::uint64_t type;
            BorrowMode mode;
            std::string name;
        };

    	/*
    	 * this may seem unnerving at first, but it is valid. for every unique `T`
    	 * the compiler will generate a separate instantiation of `type_hash<T>()`.
    	 * each instantiation has its own unique static variable and each `id` has
    	 * unique address, therefore this method will return the same address everytime
    	 * when the template parameter is the same
    	 *
    	 * TLDR: this is not reproducible across runs so this may very well be changed
    	 * when a better zero-cost solution comes around
    	 */
    	template<typename /* T */>
		static uint64_t type_hash()
    	{
    		static char id = 0;
    		return reinterpret_cast<uintptr_t>(&id);
    	}

    	template<typename T>
	    Component get_cid()
    	{
			const uint64_t th = type_hash<T>();
    		if (const auto it = component_types.find(th);
    			it != component_types.end())
			{
				return it->second;
			}

    		const Component id = next_cid++;
    		component_types[th] = id;
    		component_hashes[id] = th;
    		component_layouts[id] = ColumnLayout::of<T>();
    		component_names[id] = type_name<T>();
    		return id;
    	}

    	template<typename T>
    	std::optional<Component> find_cid() const
    	{
    		if (const auto it = component_types.find(type_hash<T>());
    			it != component_types.end())
    		{
    			return it->second;
    		}
    		return std::nullopt;
    	}

        std::vector<Borrow> acquire(const std::vector<BorrowRequest>& requests) const;

        void release(std::uint64_t type, BorrowMode mode) const;

        /* direct access is refused while a handle holds the storage in a conflicting mode */
        void ensure_unborrowed(std::uint64_t type, BorrowMode access, const std::string& name) const;

        /*
         * moving an entity to another archetype relocates every component it carries,
         * which invalidates pointers handed out by storage handles. refused while any of
         * them is read-borrowed; `writers_allowed` is set for changes made through a write
         * handle, whose own batch holds write borrows
         */
        void ensure_movable(std::uint64_t entity_id, bool writers_allowed) const;

        template<typename... Ts, std::size_t... I>
        std::tuple<ReadStorage<Ts>...> wrap_read(std::vector<Borrow>& granted, std::index_sequence<I...>) const;

        template<typename... Ts, std::size_t... I>
        std::tuple<WriteStorage<Ts>...> wrap_write(std::vector<Borrow>& granted, std::index_sequence<I...>);

        /* unchecked component access shared by the direct api and the storage handles */
        template<typename T>
        T* find_component(Entity e) const;

        template<typename T>
        void emplace_component(Entity e, T value);

        template<typename T>
        std::optional<T> take_component(Entity e);

        Archetype *create_archetype(const std::vector<Component> &components);

		Archetype *find_archetype(const std::vector<Component> &components);

		Archetype *find_archetype_with(Archetype *source, Component component);

		Archetype *find_archetype_without(Archetype *source, Component component);

		void move_entity(std::uint64_t entity_id, Record &record, Archetype *destination);

        std::unordered_map<uint64_t, Archetype *> archetypes;
        std::unordered_map<uint64_t, Record> entity_records;

        std::unordered_map<uint64_t, Generation> generations; /* a sparse set to track decoded entity's id */
		/* maps entity ids to their index poses in the entity pools */
		std::unordered_map<uint64_t, size_t> entity_indices;
		std::unordered_map<std::uint64_t, Component> component_types; /* map component type to component id */
		std::unordered_map<Component, ColumnLayout> component_layouts; /* how to store each component type */
		std::unordered_map<Component, std::string> component_names;   /* demangled, for diagnostics */
		std::unordered_map<Component, std::uint64_t> component_hashes; /* component id back to type hash */

		mutable std::unordered_map<std::uint64_t, BorrowState> borrows; /* keyed by type hash */

		std::vector<uint64_t> entity_pool; /* available ids */

        Archetype *root_archetype = {}; /* entities without components */
        uint64_t alive_count;         /* the current number of alive & active entity */
		uint64_t next_eid;            /* next entity id */
		uint16_t next_cid;            /* next component id */
    };

    template<typename T>
	World *World::set(const Entity e, const T &data)
	{
		ensure_unborrowed(type_hash<T>(), BorrowMode::WRITE, type_name<T>());
		if (!is_alive(e))
			throw InvalidEntityError(get_eid(e), get_egen(e), __FILE__, __LINE__);

		if (!has<T>(e))
			ensure_movable(get_eid(e), false);

		emplace_component<T>(e, data);
		return this;
	}

	template<typename T>
	bool World::has(const Entity e) const
	{
		const std::optional<Component> component_id = find_cid<T>();
		if (!component_id || !is_alive(e))
			return false;

		const auto it = entity_records.find(get_eid(e));
		if (it == entity_records.end())
			return false;

		return it->second.archetype->has(*component_id);
	}

    template<typename T>
	T *World::get(const Entity e)
	{
		ensure_unborrowed(type_hash<T>(), BorrowMode::READ, type_name<T>());
		return find_component<T>(e);
	}

    template<typename T>
	const T *World::get(const Entity e) const
	{
		ensure_unborrowed(type_hash<T>(), BorrowMode::READ, type_name<T>());
		return find_component<T>(e);
	}

	template<typename T>
	std::optional<T> World::remove(const Entity e)
	{
		ensure_unborrowed(type_hash<T>(), BorrowMode::WRITE, type_name<T>());
		if (!has<T>(e))
			return std::nullopt;

		ensure_movable(get_eid(e), false);
		return take_component<T>(e);
	}

	template<typename... Ts>
	std::tuple<ReadStorage<Ts>...> World::read_storages() const
	{
		std::vector<Borrow> granted = acquire({ BorrowRequest { type_hash<Ts>(), BorrowMode::READ, type_name<Ts>() }... });
		return wrap_read<Ts...>(granted, std::index_sequence_for<Ts...> {});
	}

	template<typename... Ts>
	std::tuple<WriteStorage<Ts>...> World::write_storages()
	{
		std::vector<Borrow> granted = acquire({ BorrowRequest { type_hash<Ts>(), BorrowMode::WRITE, type_name<Ts>() }... });
		return wrap_write<Ts...>(granted, std::index_sequence_for<Ts...> {});
	}

	template<typename T>
	ReadStorage<T> World::read_storage() const
	{
		return std::get<0>(read_storages<T>());
	}

	template<typename T>
	WriteStorage<T> World::write_storage()
	{
		return std::get<0>(write_storages<T>());
	}

	template<typename... Ts, std::size_t... I>
	std::tuple<ReadStorage<Ts>...> World::wrap_read(std::vector<Borrow> &granted, std::index_sequence<I...>) const
	{
		return std::tuple<ReadStorage<Ts>...>(ReadStorage<Ts>(this, std::move(granted[I]))...);
	}

	template<typename... Ts, std::size_t... I>
	std::tuple<WriteStorage<Ts>...> World::wrap_write(std::vector<Borrow> &granted, std::index_sequence<I...>)
	{
		return std::tuple<WriteStorage<Ts>...>(WriteStorage<Ts>(this, std::move(granted[I]))...);
	}

	template<typename T>
	T *World::find_component(const Entity e) const
	{
		const std::optional<Component> component_id = find_cid<T>();
		if (!component_id || !is_alive(e))
			return nullptr;

		const uint64_t entity_id = get_eid(e);
		const auto it = entity_records.find(entity_id);
		if (it == entity_records.end())
			return nullptr;

		const Archetype *archetype = it->second.archetype;
		if (!archetype->has(*component_id))
			return nullptr;

		return archetype->columns.at(*component_id).get_as<T>(archetype->row_of(entity_id));
	}

	template<typename T>
	void World::emplace_component(const Entity e, T value)
	{
		const uint64_t entity_id = get_eid(e);
		const Component component_id = get_cid<T>();

		Record &record = entity_records.at(entity_id);
		if (Archetype *current = record.archetype;
			!current->has(component_id)) /* migrate first, then write the new column */
		{
			move_entity(entity_id, record, find_archetype_with(current, component_id));
		}

		Archetype *archetype = record.archetype;
		archetype->columns.at(component_id).construct_at<T>(archetype->row_of(entity_id), std::move(value));
	}

	template<typename T>
	std::optional<T> World::take_component(const Entity e)
	{
		T *component = find_component<T>(e);
		if (!component)
			return std::nullopt;

		std::optional<T> prior(std::move(*component));

		const uint64_t entity_id = get_eid(e);
		Record &record = entity_records.at(entity_id);
		move_entity(entity_id, record, find_archetype_without(record.archetype, *find_cid<T>()));
		return prior;
	}

	/* storage handles */

	template<typename T>
	ReadStorage<T>::ReadStorage(const World *world, Borrow borrow) : world(world), borrow(std::move(borrow)) {}

	template<typename T>
	const T *ReadStorage<T>::get(const Entity e) const
	{
		return world->template find_component<T>(e);
	}

	template<typename T>
	bool ReadStorage<T>::contains(const Entity e) const
	{
		return get(e) != nullptr;
	}

	template<typename T>
	WriteStorage<T>::WriteStorage(World *world, Borrow borrow) : world(world), borrow(std::move(borrow)) {}

	template<typename T>
	T *WriteStorage<T>::get(const Entity e) const
	{
		return world->template find_component<T>(e);
	}

	template<typename T>
	bool WriteStorage<T>::contains(const Entity e) const
	{
		return get(e) != nullptr;
	}

	template<typename T>
	std::error_code WriteStorage<T>::insert(const Entity e, T value)
	{
		if (!world->is_alive(e))
			return make_error_code(StorageErrc::dead_entity);

		if (!world->template has<T>(e))
			world->ensure_movable(World::get_eid(e), true);

		world->template emplace_component<T>(e, std::move(value));
		return {};
	}

	template<typename T>
	std::optional<T> WriteStorage<T>::remove(const Entity e)
	{
		if (!world->template has<T>(e))
			return std::nullopt;

		world->ensure_movable(World::get_eid(e), true);
		return world->template take_component<T>(e);
	}

	template<typename T>
	EntityBuilder &EntityBuilder::attach(const T &component)
	{
		world->set<T>(entity, component);
		return *this;
	}
}
