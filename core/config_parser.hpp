#pragma once
#include "string_view.hpp"
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace config
{
class Error: public std::runtime_error
{
public:
	explicit Error(const std::string& msg);
};

class SyntaxError: public Error
{
public:
	using Position = std::size_t;

	SyntaxError(Position where, const std::string& what):
		Error{ what },
		pos{ where }
	{}

	auto where() const noexcept -> Position { return pos; }

private:
	const Position pos;
};

struct Setting
{
	std::string key;
	std::string value;
	std::size_t line;
};

struct Route
{
	std::string path;
	std::string handler;
	std::size_t line;
};

// statements in order of appearance, split by kind
struct Document
{
	std::string name;
	std::vector<Setting> settings;
	std::vector<Route> routes;
};

// name appears in error messages only
auto parse(string_view text, const std::string& name = {}) -> Document;
auto load(const std::filesystem::path& path) -> Document;
}
