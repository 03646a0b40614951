#include "options.hpp"
#include "config_parser.hpp"
#include <boost/lexical_cast.hpp>
#include <functional>
#include <set>
#include <unordered_map>

using std::string;

namespace
{
decltype(Options::LogTypes::MessagesLog::dest) parse_msg_dest(const string& s)
{
	if (s == "console")
		return Options::LogTypes::Console{};
	return Options::LogTypes::File{ s };
}

decltype(Options::LogTypes::ResolutionLog::dest) parse_resolution_dest(const string& s)
{
	if (s == "null")
		return Options::LogTypes::Null{};
	if (s == "console")
		return Options::LogTypes::Console{};
	return Options::LogTypes::File{ s };
}

Options::LogTypes::Severity parse_severity(const string& s)
{
	using severity = Options::LogTypes::Severity;
	static const std::unordered_map<string, severity> severities = {
		{ "error",   severity::error },
		{ "warning", severity::warning },
		{ "info",    severity::info },
		{ "debug",   severity::debug },
		{ "trace",   severity::trace },
	};

	auto it = severities.find(s);
	if (it == severities.end())
		throw std::invalid_argument{ "unknown severity: " + s };
	return it->second;
}

unsigned parse_workers(const string& s)
{
	unsigned n = 0;
	const auto digits = !s.empty() && s.find_first_not_of("0123456789") == string::npos;
	if (!digits || !boost::conversion::try_lexical_convert(s, n) || n == 0)
		throw std::invalid_argument{ "positive integer expected, got: " + s };
	return n;
}

string where(const config::Document& doc, std::size_t line)
{
	return (doc.name.empty() ? string{ "line " } : doc.name + ":") + std::to_string(line);
}
}

Options::Options(const config::Document& doc):
	source{ doc.name }
{
	using Setter = std::function<void(Options&, const string&)>;
	static const std::unordered_map<string, Setter> setters = {
		{ "workers", [](Options& o, const string& v) { o.n_workers = parse_workers(v); } },
		{ "log.level", [](Options& o, const string& v) { o.log.messages.level = parse_severity(v); } },
		{ "log.messages", [](Options& o, const string& v) { o.log.messages.dest = parse_msg_dest(v); } },
		{ "log.access", [](Options& o, const string& v) { o.log.resolution.dest = parse_resolution_dest(v); } },
	};

	std::set<string> seen;
	for (auto& s: doc.settings) {
		const auto prefix = where(doc, s.line) + ": " + s.key + ": ";

		auto setter = setters.find(s.key);
		if (setter == setters.end())
			throw Error{ prefix + "unknown key" };
		if (!seen.insert(s.key).second)
			throw Error{ prefix + "repeated key" };

		try {
			setter->second(*this, s.value);
		} catch (std::invalid_argument& e) {
			throw Error{ prefix + e.what() };
		}
	}

	routes.reserve(doc.routes.size());
	for (auto& r: doc.routes)
		routes.push_back({ r.path, r.handler, r.line });
}
