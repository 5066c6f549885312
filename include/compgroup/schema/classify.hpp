#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace compgroup
{
	/* where a field was declared; empty when unknown */
	struct SourceSpan
	{
		std::string_view file;
		std::uint32_t line = 0;
	};

	/* one field of a record definition: its name and its type exactly as written */
	struct FieldSpec
	{
		std::string_view name;
		std::string_view declared_type;
		SourceSpan span = {};
	};

	struct ClassifiedField
	{
		std::string_view name;
		std::string_view payload_type; /* the type stored per component */
		bool is_optional = false;
		SourceSpan span = {};
	};

	namespace detail
	{
		constexpr bool is_space(const char c)
		{
			return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
		}

		constexpr bool is_ident_start(const char c)
		{
			return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
		}

		constexpr bool is_ident_char(const char c)
		{
			return is_ident_start(c) || (c >= '0' && c <= '9');
		}

		constexpr std::string_view trim(std::string_view text)
		{
			while (!text.empty() && is_space(text.front()))
				text.remove_prefix(1);
			while (!text.empty() && is_space(text.back()))
				text.remove_suffix(1);
			return text;
		}

		/* true when `text` is `keyword` optionally followed by a non-identifier character */
		constexpr bool starts_with_keyword(const std::string_view text, const std::string_view keyword)
		{
			return text.starts_with(keyword) &&
			       (text.size() == keyword.size() || !is_ident_char(text[keyword.size()]));
		}

		/* template arguments that are values rather than types */
		constexpr bool is_type_argument(const std::string_view arg)
		{
			const char c = arg.front();
			if ((c >= '0' && c <= '9') || c == '\'' || c == '"' || c == '-' || c == '+' ||
			    c == '(' || c == '!' || c == '~')
				return false;

			for (const std::string_view keyword : { "true", "false", "nullptr", "sizeof", "alignof", "noexcept" })
			{
				if (starts_with_keyword(arg, keyword))
					return false;
			}
			return true;
		}

		/*
		 * returns the argument of `Option<T>` when the text is exactly one unqualified
		 * path segment named `Option` with one angle-bracketed type argument. this is a
		 * purely textual test: `std::optional<T>`, `::Option<T>` or `ns::Option<T>` are
		 * not recognized and any user type spelled `Option<T>` is
		 */
		constexpr std::optional<std::string_view> inner_option_type(const std::string_view declared)
		{
			const std::string_view text = trim(declared);
			if (text.empty() || !is_ident_start(text.front()))
				return std::nullopt; /* `::Option<T>`, references, pointers, tuples, arrays */

			std::size_t ident_end = 0;
			while (ident_end < text.size() && is_ident_char(text[ident_end]))
				++ident_end;

			if (text.substr(0, ident_end) != "Option")
				return std::nullopt;

			/* the bracket must follow the identifier directly; `Option::<T>` is rejected */
			const std::string_view rest = trim(text.substr(ident_end));
			if (rest.empty() || rest.front() != '<')
				return std::nullopt;

			std::size_t angles = 0;
			std::size_t groups = 0; /* parentheses, brackets and braces; `<` and `>` inside them are operators */
			std::size_t commas = 0;
			std::size_t close = std::string_view::npos;
			for (std::size_t i = 0; i < rest.size() && close == std::string_view::npos; ++i)
			{
				switch (rest[i])
				{
					case '<':
						if (groups == 0)
							++angles;
						break;
					case '>':
						if (groups > 0 || (i > 0 && rest[i - 1] == '-'))
							break;
						if (--angles == 0)
							close = i;
						break;
					case '(':
					case '[':
					case '{':
						++groups;
						break;
					case ')':
					case ']':
					case '}':
						if (groups == 0)
							return std::nullopt;
						--groups;
						break;
					case ',':
						if (angles == 1 && groups == 0)
							++commas;
						break;
					default:
						break;
				}
			}

			if (close == std::string_view::npos)
				return std::nullopt;

			/* anything after the bracket qualifies the wrapper itself: `Option<T>*`, `Option<T>::type` */
			if (!trim(rest.substr(close + 1)).empty())
				return std::nullopt;

			const std::string_view arg = trim(rest.substr(1, close - 1));
			if (commas != 0 || arg.empty() || !is_type_argument(arg))
				return std::nullopt;

			return arg;
		}
	}

	/* decides whether a field is optional and what it stores; never fails */
	constexpr ClassifiedField classify(const FieldSpec& field) noexcept
	{
		if (const std::optional<std::string_view> inner = detail::inner_option_type(field.declared_type))
			return { field.name, *inner, true, field.span };

		return { field.name, field.declared_type, false, field.span };
	}
}
