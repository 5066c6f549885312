#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>
#include <gtest/gtest.h>
#include <compgroup/compgroup.hpp>

using compgroup::Option;

struct Position
{
	float x, y, z;
	Position(float x = 0, float y = 0, float z = 0) : x(x), y(y), z(z) {}

	bool operator==(const Position &other) const
	{
		return x == other.x && y == other.y && z == other.z;
	}
};

struct Velocity
{
	float x, y, z;
	Velocity(float x = 0, float y = 0, float z = 0) : x(x), y(y), z(z) {}

	bool operator==(const Velocity &other) const
	{
		return x == other.x && y == other.y && z == other.z;
	}
};

struct Health
{
	int value;
	Health(int value = 0) : value(value) {}

	bool operator==(const Health &other) const
	{
		return value == other.value;
	}
};

struct Animation
{
	int frame = 0;

	bool operator==(const Animation &other) const
	{
		return frame == other.frame;
	}
};

struct Name
{
	std::string name;

	bool operator==(const Name &other) const
	{
		return name == other.name;
	}
};

#define UNIT_FIELDS(FIELD)             \
	FIELD(position, Position)          \
	FIELD(health, Health)              \
	FIELD(animation, Option<Animation>)

COMPGROUP_DEFINE(Unit, UNIT_FIELDS);

bool operator==(const Unit &lhs, const Unit &rhs)
{
	return lhs.position == rhs.position && lhs.health == rhs.health && lhs.animation == rhs.animation;
}

/* an existing aggregate bound after the fact; `std::optional` is not the recognized spelling */
struct Tagged
{
	Name name;
	std::optional<Animation> animation;
};

#define TAGGED_FIELDS(FIELD) \
	FIELD(name, Name)        \
	FIELD(animation, std::optional<Animation>)

COMPGROUP_SCHEMA(Tagged, TAGGED_FIELDS)

#define OPTIONAL_ONLY_FIELDS(FIELD) \
	FIELD(name, Option<Name>)       \
	FIELD(animation, Option<Animation>)

COMPGROUP_DEFINE(Decoration, OPTIONAL_ONLY_FIELDS);

using Units = compgroup::Group<Unit>;

class GroupTest : public testing::Test
{
protected:
	compgroup::World world;

	static Unit unit(const float x, const int hp, const std::optional<Animation> animation = std::nullopt)
	{
		return Unit { Position { x, 0.0f, 0.0f }, Health { hp }, animation };
	}
};

TEST_F(GroupTest, RoundTrip)
{
	const Unit original = unit(1.0f, 100, Animation { 3 });
	const compgroup::Entity entity = Units::create(original, world);

	EXPECT_TRUE(world.is_alive(entity));
	EXPECT_EQ(Units::load(world, entity), original);

	const Unit without = unit(2.0f, 50);
	const compgroup::Entity other = Units::create(without, world);
	EXPECT_EQ(Units::load(world, other), without);
}

TEST_F(GroupTest, CreateOmitsNone)
{
	const compgroup::Entity entity = Units::create(unit(1.0f, 100), world);

	EXPECT_TRUE(world.has<Position>(entity));
	EXPECT_TRUE(world.has<Health>(entity));
	EXPECT_FALSE(world.has<Animation>(entity));

	EXPECT_EQ(world.get<Animation>(entity), nullptr);
}

TEST_F(GroupTest, CreateAttachesSome)
{
	const compgroup::Entity entity = Units::create(unit(1.0f, 100, Animation { 7 }), world);

	ASSERT_NE(world.get<Animation>(entity), nullptr);
	EXPECT_EQ(world.get<Animation>(entity)->frame, 7);
}

TEST_F(GroupTest, AllOptionalRecord)
{
	const compgroup::Entity empty = compgroup::Group<Decoration>::create({}, world);
	EXPECT_TRUE(world.is_alive(empty));
	EXPECT_FALSE(world.has<Name>(empty));
	EXPECT_FALSE(world.has<Animation>(empty));

	/* with no required field every live entity matches */
	const auto matches = compgroup::Group<Decoration>::all(world);
	ASSERT_EQ(matches.size(), 1);
	EXPECT_EQ(matches[0].first, empty);
	EXPECT_FALSE(matches[0].second.name.has_value());
}

TEST_F(GroupTest, LoadMissingOptional)
{
	const compgroup::Entity entity = world.entity();
	world.set<Position>(entity, { 1.0f, 2.0f, 3.0f });
	world.set<Health>(entity, { 10 });

	const Unit loaded = Units::load(world, entity);
	EXPECT_EQ(loaded.position, Position(1.0f, 2.0f, 3.0f));
	EXPECT_EQ(loaded.health, Health(10));
	EXPECT_FALSE(loaded.animation.has_value());
}

TEST_F(GroupTest, LoadMissingRequired)
{
	const compgroup::Entity entity = world.entity();
	world.set<Position>(entity, { 1.0f, 2.0f, 3.0f });

	try
	{
		static_cast<void>(Units::load(world, entity));
		FAIL() << "expected MissingComponentError";
	}
	catch (const compgroup::MissingComponentError &e)
	{
		const std::string what = e.what();
		EXPECT_NE(what.find("bug"), std::string::npos);
		EXPECT_NE(what.find("Health"), std::string::npos);
		EXPECT_EQ(e.component(), "Health");
		EXPECT_EQ(e.entity(), entity);
	}

	/* the failed load released its borrows */
	EXPECT_NO_THROW(world.write_storage<Health>());
}

TEST_F(GroupTest, LoadIsACopy)
{
	const compgroup::Entity entity = Units::create(unit(1.0f, 100, Animation { 1 }), world);

	Unit loaded = Units::load(world, entity);
	loaded.health.value = 5;
	loaded.animation->frame = 9;

	EXPECT_EQ(world.get<Health>(entity)->value, 100);
	EXPECT_EQ(world.get<Animation>(entity)->frame, 1);
}

TEST_F(GroupTest, FirstMatchRequiresOnlyRequired)
{
	/* missing a required component: never returned */
	const compgroup::Entity partial = world.entity();
	world.set<Position>(partial, { 9.0f, 9.0f, 9.0f });
	world.set<Animation>(partial, { 4 });

	EXPECT_FALSE(Units::first_match(world).has_value());

	/* missing only the optional one: returned with the field empty */
	const compgroup::Entity entity = world.entity();
	world.set<Position>(entity, { 1.0f, 0.0f, 0.0f });
	world.set<Health>(entity, { 10 });

	const auto match = Units::first_match(world);
	ASSERT_TRUE(match.has_value());
	EXPECT_EQ(match->first, entity);
	EXPECT_EQ(match->second.position, Position(1.0f, 0.0f, 0.0f));
	EXPECT_FALSE(match->second.animation.has_value());

	const Unit only = Units::exactly_one(world);
	EXPECT_EQ(only, match->second);
}

TEST_F(GroupTest, FirstMatchIsStable)
{
	for (auto i = 0; i < 6; ++i)
		static_cast<void>(Units::create(unit(static_cast<float>(i), i), world));

	const auto first = Units::first_match(world);
	const auto again = Units::first_match(world);
	ASSERT_TRUE(first.has_value());
	ASSERT_TRUE(again.has_value());
	EXPECT_EQ(first->first, again->first);

	const auto every = Units::all(world);
	ASSERT_EQ(every.size(), 6);
	EXPECT_EQ(every.front().first, first->first);

	std::set<compgroup::Entity> seen;
	for (const auto &[entity, record] : every)
	{
		seen.insert(entity);
		EXPECT_EQ(Units::load(world, entity), record);
	}
	EXPECT_EQ(seen.size(), 6);

	const auto repeated = Units::all(world);
	ASSERT_EQ(repeated.size(), every.size());
	for (size_t i = 0; i < every.size(); ++i)
		EXPECT_EQ(repeated[i].first, every[i].first);
}

TEST_F(GroupTest, FirstMatchEmptyWorld)
{
	EXPECT_FALSE(Units::first_match(world).has_value());
	EXPECT_TRUE(Units::all(world).empty());
}

TEST_F(GroupTest, UpdateOverwrites)
{
	const compgroup::Entity entity = Units::create(unit(1.0f, 100), world);
	world.set<Velocity>(entity, { 1.0f, 1.0f, 1.0f });

	const Unit changed = unit(5.0f, 20, Animation { 2 });
	EXPECT_FALSE(Units::update(changed, world, entity));

	EXPECT_EQ(Units::load(world, entity), changed);

	/* components outside the group are left alone */
	ASSERT_NE(world.get<Velocity>(entity), nullptr);
	EXPECT_EQ(*world.get<Velocity>(entity), Velocity(1.0f, 1.0f, 1.0f));
}

TEST_F(GroupTest, UpdateAttachesMissingRequired)
{
	const compgroup::Entity entity = world.entity();

	EXPECT_FALSE(Units::update(unit(3.0f, 30), world, entity));
	EXPECT_TRUE(world.has<Position>(entity));
	EXPECT_TRUE(world.has<Health>(entity));
	EXPECT_FALSE(world.has<Animation>(entity));
}

TEST_F(GroupTest, UpdateNoneIsIdempotent)
{
	const compgroup::Entity entity = Units::create(unit(1.0f, 100, Animation { 2 }), world);

	const Unit cleared = unit(1.0f, 100);
	EXPECT_FALSE(Units::update(cleared, world, entity));
	EXPECT_FALSE(world.has<Animation>(entity));

	const auto before = world.entities();
	EXPECT_FALSE(Units::update(cleared, world, entity));
	EXPECT_FALSE(world.has<Animation>(entity));
	EXPECT_EQ(Units::load(world, entity), cleared);

	const auto after = world.entities();
	ASSERT_EQ(before.size(), after.size());
	for (size_t i = 0; i < before.size(); ++i)
		EXPECT_EQ(before[i], after[i]);
}

TEST_F(GroupTest, UpdateDeadEntity)
{
	const compgroup::Entity entity = Units::create(unit(1.0f, 100), world);
	world.despawn(entity);

	const compgroup::UpdateError error = Units::update(unit(2.0f, 20, Animation { 1 }), world, entity);
	EXPECT_EQ(error, compgroup::StorageErrc::dead_entity);
	EXPECT_TRUE(error.category() == compgroup::storage_category());

	/* nothing was written to a recycled occupant either */
	const compgroup::Entity recycled = world.entity();
	EXPECT_EQ(compgroup::World::get_eid(recycled), compgroup::World::get_eid(entity));
	EXPECT_FALSE(world.has<Position>(recycled));
	EXPECT_FALSE(world.has<Health>(recycled));
	EXPECT_FALSE(world.has<Animation>(recycled));
}

TEST_F(GroupTest, RemoveDetachesGroupOnly)
{
	const compgroup::Entity entity = Units::create(unit(1.0f, 100, Animation { 4 }), world);
	world.set<Velocity>(entity, { 7.0f, 8.0f, 9.0f });
	world.set<Name>(entity, { "keep" });

	const Unit removed = Units::remove(world, entity);
	EXPECT_EQ(removed, unit(1.0f, 100, Animation { 4 }));

	EXPECT_FALSE(world.has<Position>(entity));
	EXPECT_FALSE(world.has<Health>(entity));
	EXPECT_FALSE(world.has<Animation>(entity));

	EXPECT_TRUE(world.is_alive(entity));
	ASSERT_NE(world.get<Velocity>(entity), nullptr);
	EXPECT_EQ(*world.get<Velocity>(entity), Velocity(7.0f, 8.0f, 9.0f));
	ASSERT_NE(world.get<Name>(entity), nullptr);
	EXPECT_EQ(world.get<Name>(entity)->name, "keep");
}

TEST_F(GroupTest, RemoveMissingOptional)
{
	const compgroup::Entity entity = Units::create(unit(1.0f, 100), world);

	const Unit removed = Units::remove(world, entity);
	EXPECT_FALSE(removed.animation.has_value());
	EXPECT_EQ(removed.health, Health(100));
}

TEST_F(GroupTest, RemoveMissingRequired)
{
	const compgroup::Entity entity = world.entity();
	world.set<Position>(entity, { 1.0f, 2.0f, 3.0f });

	EXPECT_THROW(static_cast<void>(Units::remove(world, entity)), compgroup::MissingComponentError);
}

TEST_F(GroupTest, ExactlyOneNoMatch)
{
	std::error_code ec;
	EXPECT_FALSE(Units::exactly_one(world, ec).has_value());
	EXPECT_EQ(ec, compgroup::LookupErrc::no_match);

	/* an entity lacking a required component does not count */
	const compgroup::Entity entity = world.entity();
	world.set<Position>(entity, { 1.0f, 2.0f, 3.0f });

	EXPECT_FALSE(Units::exactly_one(world, ec).has_value());
	EXPECT_EQ(ec, compgroup::LookupErrc::no_match);

	try
	{
		static_cast<void>(Units::exactly_one(world));
		FAIL() << "expected LookupError";
	}
	catch (const compgroup::LookupError &e)
	{
		EXPECT_EQ(e.code(), compgroup::LookupErrc::no_match);
		EXPECT_NE(std::string(e.what()).find("Unit"), std::string::npos);
	}
}

TEST_F(GroupTest, ExactlyOneAmbiguous)
{
	static_cast<void>(Units::create(unit(1.0f, 10), world));
	static_cast<void>(Units::create(unit(2.0f, 20), world));

	std::error_code ec;
	EXPECT_FALSE(Units::exactly_one(world, ec).has_value());
	EXPECT_EQ(ec, compgroup::LookupErrc::ambiguous);
	EXPECT_STREQ(ec.category().name(), "compgroup.lookup");

	EXPECT_THROW(static_cast<void>(Units::exactly_one(world)), compgroup::LookupError);
}

TEST_F(GroupTest, ExactlyOneClearsError)
{
	const Unit only = unit(1.0f, 10, Animation { 5 });
	static_cast<void>(Units::create(only, world));

	std::error_code ec = compgroup::LookupErrc::ambiguous;
	const std::optional<Unit> found = Units::exactly_one(world, ec);
	EXPECT_FALSE(ec);
	ASSERT_TRUE(found.has_value());
	EXPECT_EQ(*found, only);
}

TEST_F(GroupTest, IsolationAcrossWorlds)
{
	compgroup::World other;

	const compgroup::Entity source = Units::create(unit(1.0f, 100, Animation { 1 }), world);
	const compgroup::Entity copy = Units::create(Units::load(world, source), other);

	other.get<Health>(copy)->value = 1;
	other.get<Animation>(copy)->frame = 99;
	EXPECT_EQ(Units::load(world, source), unit(1.0f, 100, Animation { 1 }));

	world.get<Position>(source)->x = 42.0f;
	EXPECT_EQ(Units::load(other, copy).position, Position(1.0f, 0.0f, 0.0f));
}

TEST_F(GroupTest, MoveBetweenWorlds)
{
	compgroup::World other;

	const compgroup::Entity source = Units::create(unit(1.0f, 100, Animation { 3 }), world);
	world.set<Velocity>(source, { 1.0f, 2.0f, 3.0f });

	const compgroup::Entity moved = Units::create(Units::remove(world, source), other);

	EXPECT_EQ(Units::load(other, moved), unit(1.0f, 100, Animation { 3 }));
	EXPECT_FALSE(other.has<Velocity>(moved));

	/* the non-group component stays behind */
	EXPECT_TRUE(world.has<Velocity>(source));
	EXPECT_FALSE(Units::first_match(world).has_value());
}

TEST_F(GroupTest, StdOptionalIsRequired)
{
	using TaggedGroup = compgroup::Group<Tagged>;

	const compgroup::GroupSchema &schema = TaggedGroup::schema();
	ASSERT_EQ(schema.size(), 2);
	EXPECT_FALSE(schema.fields()[1].is_optional);
	EXPECT_EQ(schema.fields()[1].payload_type, "std::optional<Animation>");

	/* an empty `std::optional` is still stored, as a component of its own type */
	const compgroup::Entity entity = TaggedGroup::create(Tagged { Name { "bare" }, std::nullopt }, world);
	EXPECT_TRUE(world.has<std::optional<Animation>>(entity));
	EXPECT_FALSE(world.has<Animation>(entity));

	const Tagged loaded = TaggedGroup::load(world, entity);
	EXPECT_EQ(loaded.name, Name { "bare" });
	EXPECT_FALSE(loaded.animation.has_value());

	/* and an entity without it does not match */
	const compgroup::Entity untagged = world.entity();
	world.set<Name>(untagged, { "untagged" });
	const auto every = TaggedGroup::all(world);
	ASSERT_EQ(every.size(), 1);
	EXPECT_EQ(every[0].first, entity);
}

TEST_F(GroupTest, BorrowsAreReleased)
{
	const compgroup::Entity entity = Units::create(unit(1.0f, 100), world);

	static_cast<void>(Units::first_match(world));
	static_cast<void>(Units::load(world, entity));
	static_cast<void>(Units::all(world));
	EXPECT_FALSE(Units::update(unit(2.0f, 20), world, entity));

	/* every storage is free again */
	EXPECT_NO_THROW((world.write_storages<Position, Health, Animation>()));
}

TEST_F(GroupTest, BorrowConflict)
{
	const compgroup::Entity entity = Units::create(unit(1.0f, 100), world);

	{
		const auto healths = world.read_storage<Health>();

		/* shared with another reader */
		EXPECT_NO_THROW(static_cast<void>(Units::load(world, entity)));

		/* a writer must wait */
		EXPECT_THROW(static_cast<void>(Units::update(unit(2.0f, 20), world, entity)), compgroup::BorrowConflictError);
		EXPECT_THROW(static_cast<void>(Units::remove(world, entity)), compgroup::BorrowConflictError);
	}

	{
		auto animations = world.write_storage<Animation>();
		EXPECT_THROW(static_cast<void>(Units::first_match(world)), compgroup::BorrowConflictError);
	}

	/* the failed calls changed nothing */
	EXPECT_EQ(Units::load(world, entity), unit(1.0f, 100));
}

/*
 * schema {position: Position, health: Health, animation: Option<Animation>}:
 * create without an animation, attach one through storage, then clear it with update
 */
TEST_F(GroupTest, OptionalComponentLifecycle)
{
	const compgroup::Entity entity = Units::create(unit(1.0f, 100), world);
	EXPECT_FALSE(Units::load(world, entity).animation.has_value());

	{
		auto animations = world.write_storage<Animation>();
		ASSERT_FALSE(animations.insert(entity, Animation { 2 }));
	}

	const Unit animated = Units::load(world, entity);
	ASSERT_TRUE(animated.animation.has_value());
	EXPECT_EQ(*animated.animation, Animation { 2 });

	EXPECT_FALSE(Units::update(unit(1.0f, 100), world, entity));
	EXPECT_FALSE(Units::load(world, entity).animation.has_value());

	const auto animations = world.read_storage<Animation>();
	EXPECT_FALSE(animations.contains(entity));
}
