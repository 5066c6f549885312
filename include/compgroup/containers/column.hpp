#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>
#include <vector>

namespace compgroup
{
	using CopierFn = void(*)(void*, const void*);
	using DestructorFn = void(*)(void*);

	/* the type-erased shape of one component type; null functions mean trivial */
	struct ColumnLayout
	{
		std::size_t size = 0;
		CopierFn copier = nullptr;
		DestructorFn dtor = nullptr;

		template<typename T>
		static ColumnLayout of()
		{
			static_assert(alignof(T) <= alignof(std::max_align_t), "over-aligned components are not supported");

			ColumnLayout layout;
			layout.size = sizeof(T);
			if constexpr (!std::is_trivially_destructible_v<T>)
			{
				layout.dtor = [](void* ptr)
				{
					static_cast<T*>(ptr)->~T();
				};
			}

			if constexpr (!std::is_trivially_copyable_v<T>)
			{
				layout.copier = [](void* dst, const void* src)
				{
					::new (dst) T(*static_cast<const T*>(src));
				};
			}
			return layout;
		}
	};

	class Column
	{
	public:
		Column() = default;

		explicit Column(const ColumnLayout& layout);

		~Column();

		Column(const Column& other);

		Column(Column&& other) noexcept;

		Column& operator=(const Column& other);

		Column& operator=(Column&& other) noexcept;

		void resize(std::size_t new_cap);

		void clear();

		[[nodiscard]]
		void* get(std::size_t row) const;

		template<typename T>
		void load()
		{
			clear();
			shape = ColumnLayout::of<T>();
		}

		/* constructs a value at `row`, replacing whatever was constructed there */
		template<typename T, typename... Args>
		T* construct_at(const std::size_t row, Args&&... args)
		{
			if (row >= cap)
				resize(std::max(cap * 2, row + 1));

			destroy_at(row);
			void* p = static_cast<char*>(ptr) + (row * shape.size);
			T* result = std::construct_at(static_cast<T*>(p), std::forward<Args>(args)...);
			constructed[row] = true;
			return result;
		}

		void destroy_at(std::size_t row);

		/* copy-constructs `src[src_row]` into `row` of this column */
		void copy_from(std::size_t row, const Column& src, std::size_t src_row);

		/* relocates `src_row` into `dst_row` of this column; `src_row` ends up empty */
		void relocate(std::size_t dst_row, std::size_t src_row);

		template<typename T>
		T* get_as(const std::size_t row) const
		{
			void* p = get(row);
			return p ? static_cast<T*>(p) : nullptr;
		}

		[[nodiscard]] std::size_t capacity() const;

		[[nodiscard]] std::size_t size() const;

		[[nodiscard]] bool has_dtor() const;

		[[nodiscard]] bool has_copier() const;

		[[nodiscard]] bool is_constructed(std::size_t row) const;

	private:
		void* ptr = nullptr;
		std::size_t cap = 0;
		ColumnLayout shape;

		std::vector<bool> constructed;
	};
}
