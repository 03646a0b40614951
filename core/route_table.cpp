#include "route_table.hpp"
#include "logger_imp.hpp"

RouteTable::RouteTable(const Options& opts, GlobalLogger& lg):
	lg{ lg },
	source{ opts.source }
{
	SourceLoggerGuard source_lg{ lg, source };

	for (auto& r: opts.routes)
		add(r);

	lg.debug("route table loaded, ", matcher.size(), " prefix routes");
	if (!matcher.match({}).value())
		lg.warning("no default route, unmatched paths have no handler");
}

auto RouteTable::add(const Options::Route& route) -> void
{
	try {
		matcher.add_prefix_path(route.path, route.handler);
	} catch (pathmux::Error& e) {
		auto where = source.empty() ? std::string{ "line " } : source + ":";
		throw Options::Error{ where + std::to_string(route.line)
			+ ": route '" + route.path + "': " + e.what() };
	}

	lg.trace("route ", route.path, " -> ", route.handler);
}

auto RouteTable::resolve(string_view path) const -> Match
{
	return matcher.match(path);
}
