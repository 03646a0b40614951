#include "logs.hpp"
#include "logger_imp.hpp"
#include "options.hpp"
#include "string_view.hpp"
#include <boost/log/attributes/clock.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/expressions/formatters/date_time.hpp>
#include <boost/log/expressions/formatters/if.hpp>
#include <boost/log/expressions/formatters/stream.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/expressions/predicates/has_attr.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/phoenix/operator.hpp>
#include <array>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>

Logger::Severity log_severity_level = Logger::Severity::info;
bool log_resolution_enabled = false;

constexpr std::array severity_strings = {
	"!!! "sv,
	"ERR "sv,
	"WRN "sv,
	"INF "sv,
	"DBG "sv,
	"TRC "sv,
};

static std::ostream& operator<<(std::ostream& s, Logger::Severity sev)
{
	return s << severity_strings[static_cast<int>(sev)];
}

static std::ostream& operator<<(std::ostream& s, LoggerImp::Message msg)
{
	for (auto p = msg.first; p; p = p->next)
		p->print(s);
	return s;
}

namespace
{
static_assert(severity_strings[static_cast<int>(Logger::Severity::error)] == "ERR "sv);
static_assert(severity_strings[static_cast<int>(Logger::Severity::trace)] == "TRC "sv);

BOOST_LOG_ATTRIBUTE_KEYWORD(kw_lazymessage, LoggerImp::attr_name.lazy_message,
	LoggerImp::Message)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_severity, LoggerImp::attr_name.severity, Logger::Severity)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_source, LoggerImp::attr_name.source, string_view)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_worker, LoggerImp::attr_name.worker, unsigned)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_time, LoggerImp::attr_name.time,
	boost::log::attributes::local_clock::value_type)

template <typename Filter, typename Fmt>
struct SinkAdder
{
	SinkAdder(Filter filter, Fmt fmt): filter{ filter }, fmt{ fmt } {}

	bool operator()(const Options::LogTypes::Null&) const { return false; }
	bool operator()(const Options::LogTypes::Console&) const
	{
		boost::log::add_console_log(std::clog, filter, fmt);
		return true;
	}
	bool operator()(const Options::LogTypes::File& f) const
	{
		using namespace boost::log;

		add_file_log(
			keywords::file_name = f.path,
			keywords::open_mode = std::ios::out | std::ios::app,
			keywords::auto_flush = true,
			filter,
			fmt
		);
		return true;
	}

	Filter filter;
	Fmt fmt;
};

bool add_messages_sink(const Options::LogTypes::MessagesLog& log)
{
	using namespace boost::log;

	return std::visit(SinkAdder{
		keywords::filter =
			!has_attr(kw_time),
		keywords::format = expressions::stream
			<< kw_severity
			<< if_(has_attr(kw_worker))
			[
				expressions::stream << "#" << kw_worker << " "
			]
			<< if_(has_attr(kw_source))
			[
				expressions::stream << "[" << kw_source << "] "
			]
			<< kw_lazymessage
		}, log.dest);
}

bool add_resolution_sink(const Options::LogTypes::ResolutionLog& log)
{
#ifndef PATHMUX_NO_RESOLUTION_LOG
	using namespace boost::log;

	return std::visit(SinkAdder{
		keywords::filter =
			has_attr(kw_time),
		keywords::format = expressions::stream
			<< format_date_time(kw_time, "%y-%m-%d %T") << " "
			<< if_(has_attr(kw_worker))
			[
				expressions::stream << "#" << kw_worker << " "
			]
			<< kw_lazymessage
		}, log.dest);
#else
	return false;
#endif
}
}

void logs::preinit()
{
	const Options::LogTypes::MessagesLog startup_log{
		Options::LogTypes::Console{},
		Options::LogTypes::Severity::info
	};
	add_messages_sink(startup_log);
}

void logs::init(const Options& opt)
{
	const auto level = opt.log.messages.level;
	if (!Logger::compiled_in(level))
		throw std::runtime_error{ "requested log level ("
			+ std::to_string(static_cast<int>(level))
			+ ") is too high, supported: "
			+ std::to_string(PATHMUX_LOG_LEVEL) };

	log_severity_level = level;
	boost::log::core::get()->remove_all_sinks();

	add_messages_sink(opt.log.messages);
	log_resolution_enabled = add_resolution_sink(opt.log.resolution);
}
