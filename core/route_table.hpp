#pragma once
#include "options.hpp"
#include "path_matcher.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <cstddef>
#include <string>

struct GlobalLogger;

// Handler names bound to path prefixes, as read from a route file
class RouteTable: boost::noncopyable
{
public:
	using Matcher = pathmux::PathMatcher<std::string>;
	using Match = pathmux::PathMatch<std::string>;

	// throws Options::Error naming the offending route
	RouteTable(const Options& opts, GlobalLogger& lg);

	auto add(const Options::Route& route) -> void;
	auto resolve(string_view path) const -> Match;

	auto route_count() const noexcept -> std::size_t { return matcher.size(); }

private:
	GlobalLogger& lg;
	const std::string source;
	Matcher matcher;
};
