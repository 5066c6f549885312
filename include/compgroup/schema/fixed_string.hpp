#pragma once

#include <cstddef>
#include <string_view>

namespace compgroup
{
	/* a string literal usable as a template argument */
	template<std::size_t N>
	struct FixedString
	{
		char data[N + 1] = {};

		static constexpr std::size_t length = N;

		constexpr FixedString(const char (&str)[N + 1])
		{
			for (std::size_t i = 0; i < N + 1; ++i)
				data[i] = str[i];
		}

		[[nodiscard]] constexpr std::string_view view() const
		{
			return { data, N };
		}
	};

	template<std::size_t N>
	FixedString(const char (&str)[N]) -> FixedString<N - 1>;
}
