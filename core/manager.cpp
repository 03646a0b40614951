#include "manager.hpp"
#include "config_parser.hpp"
#include "dispatcher.hpp"
#include "logs.hpp"
#include "options.hpp"
#include "parameters.hpp"
#include "route_table.hpp"
#include <istream>
#include <ostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace
{
auto n_workers_default()
{
	auto n_cores = std::thread::hardware_concurrency();
	return n_cores > 0 ? n_cores : 2u;
}

auto read_paths(std::istream& in)
{
	std::vector<std::string> result;
	for (std::string line; std::getline(in, line);) {
		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		result.push_back(std::move(line));
	}
	return result;
}

auto print(std::ostream& out, const std::string& path, const RouteTable::Match& m) -> void
{
	out << path << '\t' << m.matched() << '\t' << m.remaining() << '\t';
	if (m.value())
		out << *m.value();
	else
		out << '-';
	out << '\n';
}
}

Manager::Manager(const Parameters& params):
	paths{ params.paths }
{
	init(params.config_path);

	lg.trace("manager created");
}

Manager::~Manager()
{
	lg.trace("manager destroyed");
}

auto Manager::init(const std::string& config_path) -> void
{
	lg.debug("loading route file ", config_path);

	try {
		auto doc = config::load(config_path);
		opts = std::make_unique<const Options>(doc);

		logs::init(*opts);
		table = std::make_unique<const RouteTable>(*opts, lg);

		auto n_workers = opts->n_workers.value_or_eval(n_workers_default);
		dispatcher = std::make_unique<Dispatcher>(*table, n_workers, lg);
	} catch (std::exception& e) {
		lg.error("init: ", e.what());
		throw;
	}

	lg.info("serving ", table->route_count(), " prefix routes from ", config_path);
}

auto Manager::run(std::istream& in, std::ostream& out) -> void
{
	lg.trace("manager started");

	const auto input = paths.empty() ? read_paths(in) : paths;
	const auto results = dispatcher->resolve(input);
	for (std::size_t i = 0; i < input.size(); ++i)
		print(out, input[i], results[i]);
	out.flush();

	lg.trace("manager finished, ", input.size(), " paths resolved");
}
