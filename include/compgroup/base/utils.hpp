#pragma once

#include <string>
#include <typeinfo>
#include <vector>
#include <compgroup/types.hpp>

namespace compgroup
{
	std::string demangle(const std::string& mangled_name);

	std::string get_stacktrace(int max_frames = 10);

	uint64_t archash(const std::vector<Component>& components);

	template<typename T>
	std::string type_name()
	{
		return demangle(typeid(T).name());
	}
}
