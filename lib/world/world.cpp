#include <algorithm>
#include <compgroup/world.hpp>

namespace compgroup
{
    World::World() : root_archetype(create_archetype({})), alive_count(0), next_eid(0), next_cid(0) {}

    World::~World()
    {
        for (auto& [hash, archetype] : archetypes)
        {
            for (auto& [c, edge] : archetype->add_edge)
                delete edge;
            for (auto& [c, edge] : archetype->remove_edge)
                delete edge;

            delete archetype;
        }
        archetypes.clear();
    }

    Entity World::entity()
    {
        uint64_t entity;
        Generation gen;

        if (alive_count < entity_pool.size())
        {
            /* recycling; despawn already bumped the generation */
            entity = entity_pool[alive_count];
            gen = generations[entity];
        }
        else
        {
            /* newborn path */
            entity = next_eid;
            ++next_eid;
            gen = 0;

            /* add to the pool */
            entity_pool.emplace_back(entity);
        }

        ++alive_count;
        generations[entity] = gen;
        entity_indices[entity] = alive_count - 1; /* store entity's position in the pool */

        root_archetype->append(entity);
        entity_records[entity] = { root_archetype };
        return encode_entity(entity, gen);
    }

    EntityBuilder World::create_entity()
    {
        return { this, entity() };
    }

    void World::despawn(const Entity entity)
    {
        if (!is_alive(entity))
            return;

        const uint64_t entity_id = get_eid(entity);
        ensure_movable(entity_id, false);

        /* destroys every component instance at the entity's row */
        if (const auto record_it = entity_records.find(entity_id);
            record_it != entity_records.end())
        {
            record_it->second.archetype->remove(entity_id);
            entity_records.erase(record_it);
        }

        if (const size_t index = entity_indices.at(entity_id);
            index < alive_count - 1)
        {
            entity_pool[index] = entity_pool[alive_count - 1];
            entity_indices[entity_pool[index]] = index;
        }

        entity_pool[alive_count - 1] = entity_id;
        --alive_count;

        /* update generation for reuse; wraps around at 16 bits */
        generations[entity_id] = generations[entity_id] == MAX_GENERATION ? 0 : generations[entity_id] + 1;
        entity_indices.erase(entity_id);
    }

    bool World::is_alive(const Entity e) const
    {
        const uint64_t entity_id = get_eid(e);
        if (!entity_indices.contains(entity_id))
            return false;

        const auto it = generations.find(entity_id);
        return it != generations.end() && it->second == get_egen(e);
    }

    uint64_t World::alive() const
    {
        return alive_count;
    }

    EntitiesView World::entities() const
    {
        std::vector<Entity> alive;
        alive.reserve(alive_count);
        for (uint64_t i = 0; i < alive_count; ++i)
        {
            const uint64_t entity_id = entity_pool[i];
            alive.emplace_back(encode_entity(entity_id, generations.at(entity_id)));
        }

        std::ranges::sort(alive, {}, get_eid);
        return EntitiesView(std::move(alive));
    }

    void World::dump(std::ostream &os) const
    {
        os << "world dump:\n";
        os << "  alive entities: " << alive_count << "\n";
        os << "  component types:\n";
        for (const auto& [cid, name] : component_names)
            os << "    [" << cid << "]: " << name << "\n";

        for (const auto& [hash, archetype] : archetypes)
            archetype->dump(os);
    }

    Entity World::encode_entity(const uint64_t id, const Generation gen)
    {
        return (static_cast<Entity>(gen) << GENERATION_SHIFT) | (id & ENTITY_MASK);
    }

    uint64_t World::get_eid(const Entity entity)
    {
        return entity & ENTITY_MASK;
    }

    Generation World::get_egen(const Entity entity)
    {
        return static_cast<Generation>(entity >> GENERATION_SHIFT);
    }

    std::vector<Borrow> World::acquire(const std::vector<BorrowRequest> &requests) const
    {
        /* validate the whole batch before granting anything */
        for (size_t i = 0; i < requests.size(); ++i)
        {
            const BorrowRequest &request = requests[i];
            if (const auto it = borrows.find(request.type);
                it != borrows.end())
            {
                const BorrowState &state = it->second;
                if (state.writer || (request.mode == BorrowMode::WRITE && state.readers > 0))
                    throw BorrowConflictError(request.name, request.mode);
            }

            for (size_t j = 0; j < i; ++j)
            {
                if (requests[j].type == request.type &&
                    (requests[j].mode == BorrowMode::WRITE || request.mode == BorrowMode::WRITE))
                    throw BorrowConflictError(request.name, request.mode);
            }
        }

        std::vector<Borrow> granted;
        granted.reserve(requests.size());
        for (const BorrowRequest &request : requests)
        {
            BorrowState &state = borrows[request.type];
            if (request.mode == BorrowMode::WRITE)
                state.writer = true;
            else
                ++state.readers;

            granted.emplace_back(this, request.type, request.mode);
        }
        return granted;
    }

    void World::release(const std::uint64_t type, const BorrowMode mode) const
    {
        const auto it = borrows.find(type);
        if (it == borrows.end())
            return;

        BorrowState &state = it->second;
        if (mode == BorrowMode::WRITE)
            state.writer = false;
        else if (state.readers > 0)
            --state.readers;

        if (!state.writer && state.readers == 0)
            borrows.erase(it);
    }

    void World::ensure_unborrowed(const std::uint64_t type, const BorrowMode access, const std::string &name) const
    {
        const auto it = borrows.find(type);
        if (it == borrows.end())
            return;

        if (it->second.writer || (access == BorrowMode::WRITE && it->second.readers > 0))
            throw BorrowConflictError(name, access);
    }

    void World::ensure_movable(const std::uint64_t entity_id, const bool writers_allowed) const
    {
        const auto record_it = entity_records.find(entity_id);
        if (record_it == entity_records.end())
            return;

        for (const Component c : record_it->second.archetype->components)
        {
            const auto it = borrows.find(component_hashes.at(c));
            if (it == borrows.end())
                continue;

            if (it->second.readers > 0 || (!writers_allowed && it->second.writer))
                throw BorrowConflictError(component_names.at(c), BorrowMode::WRITE);
        }
    }

    Archetype *World::create_archetype(const std::vector<Component> &components)
    {
        std::vector<Component> sorted_components = components;
        std::ranges::sort(sorted_components);

        const uint64_t hash = archash(sorted_components);
        if (const auto it = archetypes.find(hash);
            it != archetypes.end())
            return it->second;

        auto *archetype = new Archetype();
        archetype->components = sorted_components;
        archetype->id = hash;
        for (const Component c : sorted_components)
            archetype->columns.emplace(c, Column(component_layouts.at(c)));

        archetypes[hash] = archetype;
        return archetype;
    }

    Archetype *World::find_archetype_with(Archetype *source, const Component component)
    {
        if (const auto edge_it = source->add_edge.find(component);
            edge_it != source->add_edge.end() && edge_it->second->to != nullptr)
            return edge_it->second->to;

        if (source->has(component))
            return source;

        std::vector<Component> new_components = source->components;
        new_components.emplace_back(component);
        Archetype *target = find_archetype(new_components);
        if (!target)
            target = create_archetype(new_components);

        /* cache the edge for O(1) move */
        auto *edge = new GraphEdge();
        edge->from = source;
        edge->to = target;
        edge->id = component;

        source->add_edge[component] = edge;
        return target;
    }

    Archetype *World::find_archetype(const std::vector<Component> &components)
    {
        std::vector<Component> sorted_components = components;
        std::ranges::sort(sorted_components);

        const uint64_t hash = archash(sorted_components);
        if (const auto it = archetypes.find(hash);
            it != archetypes.end())
            return it->second;

        return nullptr;
    }

    Archetype *World::find_archetype_without(Archetype *source, const Component component)
    {
        if (const auto edge_it = source->remove_edge.find(component);
            edge_it != source->remove_edge.end() && edge_it->second->to != nullptr)
            return edge_it->second->to;

        if (!source->has(component))
            return source;

        /* create new component list */
        std::vector<Component> new_components;
        new_components.reserve(source->components.size() - 1);
        for (Component c: source->components)
        {
            if (c != component)
                new_components.emplace_back(c);
        }

        Archetype *target = find_archetype(new_components);
        if (!target)
            target = create_archetype(new_components);

        /* cache the edge for future use*/
        auto *edge = new GraphEdge();
        edge->from = source;
        edge->to = target;
        edge->id = component;

        source->remove_edge[component] = edge;
        return target;
    }

    void World::move_entity(const uint64_t entity_id, Record &record, Archetype *destination)
    {
        Archetype *source = record.archetype;
        if (source == destination)
            return;

        const size_t src_row = source->row_of(entity_id);
        const size_t dest_row = destination->append(entity_id);
        for (const Component comp_id: destination->components)
        {
            if (source->has(comp_id))
                destination->columns.at(comp_id).copy_from(dest_row, source->columns.at(comp_id), src_row);
        }

        /* patch; destroys the source row */
        source->remove(entity_id);
        record.archetype = destination;
    }

    Borrow::Borrow(const World *world, const std::uint64_t type, const BorrowMode mode) :
        world(world), type(type), borrow_mode(mode) {}

    Borrow::~Borrow()
    {
        release();
    }

    Borrow::Borrow(Borrow &&other) noexcept :
        world(other.world), type(other.type), borrow_mode(other.borrow_mode)
    {
        other.world = nullptr;
    }

    Borrow &Borrow::operator=(Borrow &&other) noexcept
    {
        if (this != &other)
        {
            release();
            world = other.world;
            type = other.type;
            borrow_mode = other.borrow_mode;
            other.world = nullptr;
        }
        return *this;
    }

    BorrowMode Borrow::mode() const
    {
        return borrow_mode;
    }

    void Borrow::release()
    {
        if (world)
            world->release(type, borrow_mode);
        world = nullptr;
    }

    EntitiesView::EntitiesView(std::vector<Entity> entities) : alive(std::move(entities)) {}

    EntitiesView::const_iterator EntitiesView::begin() const
    {
        return alive.begin();
    }

    EntitiesView::const_iterator EntitiesView::end() const
    {
        return alive.end();
    }

    std::size_t EntitiesView::size() const
    {
        return alive.size();
    }

    bool EntitiesView::empty() const
    {
        return alive.empty();
    }

    bool EntitiesView::contains(const Entity e) const
    {
        return std::ranges::find(alive, e) != alive.end();
    }

    Entity EntitiesView::operator[](const std::size_t index) const
    {
        return alive.at(index);
    }

    EntityBuilder::EntityBuilder(World *world, const Entity entity) : world(world), entity(entity) {}

    Entity EntityBuilder::finish() const
    {
        return entity;
    }
}
