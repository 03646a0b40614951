#pragma once
#include "logger.hpp"
#include <boost/core/noncopyable.hpp>
#include <boost/optional/optional.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace config
{
struct Document;
}

class Options: boost::noncopyable
{
public:
	struct Error: std::runtime_error
	{
		explicit Error(const std::string& s):
			runtime_error("options error: " + s) {}
	};

	struct LogTypes
	{
		using Severity = Logger::Severity;

		struct Null {};
		struct Console {};
		struct File { std::string path; };

		struct MessagesLog
		{
			std::variant<Console, File> dest;
			Severity level = Severity::info;
		};
		struct ResolutionLog
		{
			std::variant<Console, File, Null> dest;
		};
		struct Logs
		{
			MessagesLog messages;
			ResolutionLog resolution;
		};
	};

	struct Route
	{
		std::string path;
		std::string handler;
		std::size_t line = 0;
	};

	using RouteList = std::vector<Route>;

	Options() = default;
	// throws Options::Error on unknown, repeated or malformed settings
	explicit Options(const config::Document& doc);

	// route file name, for messages
	std::string source;
	// unset means one worker per core
	boost::optional<unsigned> n_workers;
	LogTypes::Logs log = {
		{ LogTypes::Console{}, LogTypes::Severity::info },
		{ LogTypes::Null{} }
	};
	RouteList routes;
};
