#pragma once
#include "logger_imp.hpp"
#include <boost/core/noncopyable.hpp>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

class Dispatcher;
class Options;
class RouteTable;
struct Parameters;

class Manager: boost::noncopyable
{
public:
	// throws on unreadable or invalid route file
	explicit Manager(const Parameters& params);
	~Manager();

	// Writes "path<TAB>matched<TAB>remaining<TAB>handler" per path.
	// Paths come from parameters, or one per line from in if there are none.
	auto run(std::istream& in, std::ostream& out) -> void;

private:
	auto init(const std::string& config_path) -> void;

	GlobalLogger lg;
	const std::vector<std::string> paths;
	std::unique_ptr<const Options> opts;
	std::unique_ptr<const RouteTable> table;
	std::unique_ptr<Dispatcher> dispatcher;
};
