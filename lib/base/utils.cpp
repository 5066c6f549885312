#include <cstdlib>
#include <cxxabi.h>
#include <execinfo.h>
#include <memory>
#include <regex>
#include <sstream>
#include <compgroup/base/utils.hpp>

/* NOTE: a faster hash algorithm can be used here instead of FNV-1a which is used for simplicity
 * by the time this is written */
namespace compgroup
{
	/* hash parameters */
	constexpr auto FNV_PRIME = 1099511628211ULL;
	constexpr auto FNV_OFFSET_BASIS = 14695981039346656037ULL;

	std::string demangle(const std::string& mangled_name)
	{
		int status = 0;
		const std::unique_ptr<char, void(*)(void*)> demangled(
			abi::__cxa_demangle(mangled_name.c_str(), nullptr, nullptr, &status),
			std::free
		);

		if (status == 0 && demangled)
			return demangled.get();
		return mangled_name;
	}

	std::string get_stacktrace(const int max_frames)
	{
		std::vector<void*> callstack(static_cast<std::size_t>(max_frames));
		const int frames = backtrace(callstack.data(), max_frames);
		const std::unique_ptr<char*, void(*)(void*)> symbols(
			backtrace_symbols(callstack.data(), frames),
			std::free
		);

		std::ostringstream stacktrace;
		stacktrace << "compgroup stacktrace:\n";
		if (!symbols)
			return stacktrace.str();

		const std::regex symbol_regex(R"(\(([^+()]+)\+)");
		/* skip i = 0 because it's our current stack frame */
		for (auto i = 1; i < frames; ++i)
		{
			const std::string frame_info(symbols.get()[i]);
			std::smatch match;

			if (std::regex_search(frame_info, match, symbol_regex) && match.size() > 1)
				stacktrace << "  " << demangle(match[1].str()) << "\n";
			else
				stacktrace << "  " << frame_info << "\n";
		}

		return stacktrace.str();
	}

	uint64_t archash(const std::vector<Component>& components)
	{
		if (components.empty())
			return 0; /* special case for empty vectors */

		uint64_t hash = FNV_OFFSET_BASIS;
		for (const Component comp : components)
		{
			const auto* bytes = reinterpret_cast<const uint8_t*>(&comp);
			for (size_t i = 0; i < sizeof(Component); ++i)
			{
				hash ^= bytes[i];
				hash *= FNV_PRIME;
			}
		}

		return hash;
	}
}
