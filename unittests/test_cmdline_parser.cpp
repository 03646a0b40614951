#include "cmdline_parser.hpp"
#include "parameters.hpp"
#include <boost/test/unit_test.hpp>
#include <boost/range/algorithm/copy.hpp>
#include <boost/range/adaptor/transformed.hpp>
#include <functional>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
using CmdlineArgs = std::vector<std::string>;

struct CmdlineFixture
{
	CommandLineParser parser;

	auto cmdline(const CmdlineArgs &args) const
	{
		std::vector<const char*> argv = { "test-program" };
		boost::copy(args | boost::adaptors::transformed(std::mem_fn(&std::string::c_str)), std::back_inserter(argv));

		auto argc = static_cast<int>(argv.size());
		return parser.parse(argc, argv.data());
	}
	auto to_parameters(const CmdlineArgs &args) const
	{
		return cmdline(args).to_parameters();
	}
};
}

#define ERROR_UNKNOWN(expr) BOOST_CHECK_THROW((expr), std::logic_error)
#define ERROR_BAD_SYNTAX(expr) BOOST_CHECK_THROW((expr), std::logic_error)
#define ERROR_MULTIPLE(expr) BOOST_CHECK_THROW((expr), std::logic_error)

BOOST_FIXTURE_TEST_SUITE(cmdline_parser_tests, CmdlineFixture)

BOOST_AUTO_TEST_CASE(help)
{
	BOOST_TEST(cmdline({ "-h" }).has("help"));
	BOOST_TEST(cmdline({ "--help" }).has("help"));
	BOOST_TEST(!cmdline({}).has("help"));
	ERROR_UNKNOWN(cmdline({ "-H" }));
	ERROR_UNKNOWN(cmdline({ "-he" }));
	ERROR_UNKNOWN(cmdline({ "-help" }));
	ERROR_UNKNOWN(cmdline({ "--hel" }));
	ERROR_BAD_SYNTAX(cmdline({ "--help=true" }));
}

BOOST_AUTO_TEST_CASE(version)
{
	BOOST_TEST(cmdline({ "-v" }).has("version"));
	BOOST_TEST(cmdline({ "--version" }).has("version"));
	BOOST_TEST(!cmdline({}).has("version"));
	ERROR_UNKNOWN(cmdline({ "-V" }));
	ERROR_UNKNOWN(cmdline({ "-ve" }));
	ERROR_UNKNOWN(cmdline({ "-version" }));
	ERROR_UNKNOWN(cmdline({ "--ver" }));
	ERROR_BAD_SYNTAX(cmdline({ "--version=1" }));
}

BOOST_AUTO_TEST_CASE(config)
{
	BOOST_TEST(to_parameters({ "-cpath/to/config" }).config_path == "path/to/config");
	BOOST_TEST(to_parameters({ "-c", "path/to/config" }).config_path == "path/to/config");
	BOOST_TEST(to_parameters({ "--config=path/to/config" }).config_path == "path/to/config");
	BOOST_TEST(to_parameters({ "--config", "path/to/config" }).config_path == "path/to/config");
	ERROR_BAD_SYNTAX(cmdline({ "-c" }));
	ERROR_BAD_SYNTAX(cmdline({ "--config" }));
	ERROR_MULTIPLE(cmdline({ "-cpath1", "-cpath2" }));
}

BOOST_AUTO_TEST_CASE(default_config)
{
	BOOST_TEST(cmdline({}).has("config"));
	BOOST_TEST(to_parameters({}).config_path == "./pathmux.conf");
}

BOOST_AUTO_TEST_CASE(paths)
{
	BOOST_TEST(!cmdline({}).has("path"));
	BOOST_TEST(to_parameters({}).paths.empty());

	const CmdlineArgs expected = { "/a/b", "/", "relative" };
	BOOST_TEST(to_parameters({ "/a/b", "/", "relative" }).paths == expected,
		boost::test_tools::per_element());

	auto p = to_parameters({ "/x", "-c", "routes.conf", "/y" });
	BOOST_TEST(p.config_path == "routes.conf");
	BOOST_TEST(p.paths == CmdlineArgs({ "/x", "/y" }), boost::test_tools::per_element());

	BOOST_TEST(to_parameters({ "--", "-h" }).paths == CmdlineArgs{ "-h" },
		boost::test_tools::per_element());
	ERROR_UNKNOWN(cmdline({ "/x", "-q" }));
}

BOOST_AUTO_TEST_CASE(print_options)
{
	std::ostringstream out;
	parser.print_options(out);
	BOOST_TEST(out.str().find("--config") != std::string::npos);
	BOOST_TEST(out.str().find("--help") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
