#include <compgroup/base/errors.hpp>
#include <compgroup/base/utils.hpp>

namespace compgroup
{
	namespace
	{
		class StorageCategory final : public std::error_category
		{
		public:
			[[nodiscard]] const char* name() const noexcept override
			{
				return "compgroup.storage";
			}

			[[nodiscard]] std::string message(const int ev) const override
			{
				switch (static_cast<StorageErrc>(ev))
				{
					case StorageErrc::dead_entity:
						return "entity is not alive in this world";
				}
				return "unknown storage error";
			}
		};

		class LookupCategory final : public std::error_category
		{
		public:
			[[nodiscard]] const char* name() const noexcept override
			{
				return "compgroup.lookup";
			}

			[[nodiscard]] std::string message(const int ev) const override
			{
				switch (static_cast<LookupErrc>(ev))
				{
					case LookupErrc::no_match:
						return "no entity carries every required component of the group";
					case LookupErrc::ambiguous:
						return "more than one entity carries every required component of the group";
				}
				return "unknown lookup error";
			}
		};
	}

	const std::error_category& storage_category() noexcept
	{
		static const StorageCategory category;
		return category;
	}

	const std::error_category& lookup_category() noexcept
	{
		static const LookupCategory category;
		return category;
	}

	std::error_code make_error_code(const StorageErrc e) noexcept
	{
		return { static_cast<int>(e), storage_category() };
	}

	std::error_code make_error_code(const LookupErrc e) noexcept
	{
		return { static_cast<int>(e), lookup_category() };
	}

	LookupError::LookupError(const std::error_code ec, const std::string& record)
	: std::system_error(ec, "lookup of " + record + " failed") {}

	InvalidEntityError::InvalidEntityError(const std::uint64_t entity_id, const Generation gen,
	                                       const char* file, const int line)
	: std::runtime_error(
	   "invalid entity access\n"
	   "  entity ID: " + std::to_string(entity_id) + "\n"
	   "  generation: " + std::to_string(gen) + "\n"
	   "  location: " + std::string(file) + ":" + std::to_string(line) + "\n" +
	   get_stacktrace()
	) {}

	MissingComponentError::MissingComponentError(const std::string_view component, const Entity entity)
	: std::logic_error(
	   "expected a " + std::string(component) + " component to be present\n"
	   "  entity ID: " + std::to_string(entity & ENTITY_MASK) + "\n"
	   "  generation: " + std::to_string(entity >> GENERATION_SHIFT) + "\n"
	   "  this is a bug: the entity was assumed to carry every required component of the group\n" +
	   get_stacktrace()
	), missing(component), target(entity) {}

	BorrowConflictError::BorrowConflictError(const std::string& component, const BorrowMode requested)
	: std::logic_error(
	   std::string("conflicting storage borrow\n") +
	   "  component: " + component + "\n" +
	   "  requested: " + (requested == BorrowMode::WRITE ? "write" : "read") + "\n" +
	   "  storage is already borrowed in a mode that excludes this request"
	) {}
}
