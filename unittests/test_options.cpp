#include "config_parser.hpp"
#include "options.hpp"
#include <boost/test/unit_test.hpp>
#include <string>
#include <variant>

namespace
{
using Severity = Options::LogTypes::Severity;

auto options(string_view text)
{
	return Options{ config::parse(text, "routes.conf") };
}

void error(string_view text, const std::string& expected)
{
	BOOST_CHECK_EXCEPTION(options(text), Options::Error,
		[&expected](const Options::Error& exc)
		{
			BOOST_TEST_INFO("exception: " << exc.what());
			return std::string{ exc.what() }.find(expected) != std::string::npos;
		});
}
}

BOOST_AUTO_TEST_SUITE(options_tests)

BOOST_AUTO_TEST_CASE(defaults)
{
	auto opts = options("");
	BOOST_TEST(opts.source == "routes.conf");
	BOOST_TEST(!opts.n_workers);
	BOOST_TEST(std::holds_alternative<Options::LogTypes::Console>(opts.log.messages.dest));
	BOOST_TEST((opts.log.messages.level == Severity::info));
	BOOST_TEST(std::holds_alternative<Options::LogTypes::Null>(opts.log.resolution.dest));
	BOOST_TEST(opts.routes.empty());
}

BOOST_AUTO_TEST_CASE(workers)
{
	BOOST_TEST(options("workers = 3").n_workers.value_or(0) == 3u);
	BOOST_TEST(options("workers = 1").n_workers.value_or(0) == 1u);

	error("workers = 0", "positive integer expected");
	error("workers = -1", "positive integer expected");
	error("workers = two", "positive integer expected");
	error("workers = 2x", "positive integer expected");
	error("workers = 99999999999999999999", "positive integer expected");
}

BOOST_AUTO_TEST_CASE(log_level)
{
	BOOST_TEST((options("log.level = error").log.messages.level == Severity::error));
	BOOST_TEST((options("log.level = warning").log.messages.level == Severity::warning));
	BOOST_TEST((options("log.level = debug").log.messages.level == Severity::debug));
	BOOST_TEST((options("log.level = trace").log.messages.level == Severity::trace));

	error("log.level = verbose", "unknown severity: verbose");
	error("log.level = DEBUG", "unknown severity");
}

BOOST_AUTO_TEST_CASE(log_destinations)
{
	auto opts = options("log.messages = /tmp/messages.log\nlog.access = console");
	auto file = std::get_if<Options::LogTypes::File>(&opts.log.messages.dest);
	BOOST_TEST_REQUIRE(file);
	BOOST_TEST(file->path == "/tmp/messages.log");
	BOOST_TEST(std::holds_alternative<Options::LogTypes::Console>(opts.log.resolution.dest));

	auto access = options("log.access = '/tmp/access log'").log.resolution.dest;
	auto access_file = std::get_if<Options::LogTypes::File>(&access);
	BOOST_TEST_REQUIRE(access_file);
	BOOST_TEST(access_file->path == "/tmp/access log");

	BOOST_TEST(std::holds_alternative<Options::LogTypes::Null>(
		options("log.access = null").log.resolution.dest));
}

BOOST_AUTO_TEST_CASE(routes)
{
	auto opts = options("route / root\nworkers = 2\nroute /api api\nroute /api/v2 'api v2'");
	BOOST_TEST_REQUIRE(opts.routes.size() == 3u);

	BOOST_TEST(opts.routes[0].path == "/");
	BOOST_TEST(opts.routes[0].handler == "root");
	BOOST_TEST(opts.routes[0].line == 1u);
	BOOST_TEST(opts.routes[1].path == "/api");
	BOOST_TEST(opts.routes[1].line == 3u);
	BOOST_TEST(opts.routes[2].handler == "api v2");
	BOOST_TEST(opts.routes[2].line == 4u);
}

BOOST_AUTO_TEST_CASE(bad_settings)
{
	error("threads = 2", "routes.conf:1: threads: unknown key");
	error("workers = 2\n\nworkers = 3", "routes.conf:3: workers: repeated key");
	error("# comment\nlog.level = loud", "routes.conf:2: log.level:");
}

BOOST_AUTO_TEST_CASE(unnamed_document)
{
	BOOST_CHECK_EXCEPTION(Options{ config::parse("\nbogus = 1") }, Options::Error,
		[](const Options::Error& exc)
		{
			return std::string{ exc.what() } == "options error: line 2: bogus: unknown key";
		});
}

BOOST_AUTO_TEST_SUITE_END()
