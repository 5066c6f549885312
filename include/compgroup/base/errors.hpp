#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <compgroup/types.hpp>

namespace compgroup
{
	/* recoverable storage failures reported by `WriteStorage<T>::insert` */
	enum class StorageErrc
	{
		dead_entity = 1
	};

	/* recoverable outcomes of `Group<R>::exactly_one` */
	enum class LookupErrc
	{
		no_match = 1,
		ambiguous
	};

	const std::error_category& storage_category() noexcept;

	const std::error_category& lookup_category() noexcept;

	std::error_code make_error_code(StorageErrc e) noexcept;

	std::error_code make_error_code(LookupErrc e) noexcept;

	/* an update stops at the first required field whose insertion fails */
	using UpdateError = std::error_code;

	class LookupError final : public std::system_error
	{
	public:
		explicit LookupError(std::error_code ec, const std::string& record);
	};

	class InvalidEntityError final : public std::runtime_error
	{
	public:
		InvalidEntityError(std::uint64_t entity_id, Generation gen, const char* file, int line);
	};

	/*
	 * thrown by `load` and `remove` when a required component is absent. these
	 * operations are only called for entities known to carry the whole group, so
	 * reaching this is a broken invariant in the caller rather than a lookup miss
	 */
	class MissingComponentError final : public std::logic_error
	{
	public:
		MissingComponentError(std::string_view component, Entity entity);

		[[nodiscard]] const std::string& component() const noexcept
		{
			return missing;
		}

		[[nodiscard]] Entity entity() const noexcept
		{
			return target;
		}

	private:
		std::string missing;
		Entity target;
	};

	class BorrowConflictError final : public std::logic_error
	{
	public:
		BorrowConflictError(const std::string& component, BorrowMode requested);
	};

	class SchemaError final : public std::invalid_argument
	{
	public:
		using std::invalid_argument::invalid_argument;
	};
}

namespace std
{
	template<>
	struct is_error_code_enum<compgroup::StorageErrc> : true_type {};

	template<>
	struct is_error_code_enum<compgroup::LookupErrc> : true_type {};
}
