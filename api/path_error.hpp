#pragma once
#include <stdexcept>
#include <string>

namespace pathmux
{
struct Error: std::runtime_error
{
	explicit Error(const std::string& s):
		runtime_error{ s } {}
};

// empty prefix path
struct InvalidArgument: Error
{
	explicit InvalidArgument(const std::string& s):
		Error{ s } {}
};

// prefix path ending with the separator
struct InvalidRoute: Error
{
	explicit InvalidRoute(const std::string& s):
		Error{ s } {}
};
}
