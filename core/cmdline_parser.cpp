#include "cmdline_parser.hpp"
#include "parameters.hpp"
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/cmdline.hpp>
#include <vector>

#ifndef PATHMUX_CONFIG_PATH
# define PATHMUX_CONFIG_PATH ./pathmux.conf
#endif

namespace
{
auto make_desc()
{
	namespace po = boost::program_options;

	po::options_description desc{ "pathmux resolves request paths by the longest registered prefix.\n"
		"Usage: pathmux [options] [path...]\nOptions are" };
	desc.add_options()
		("config,c",
			po::value<std::string>()
				->value_name("path")
				->default_value(BOOST_STRINGIZE(PATHMUX_CONFIG_PATH)),
			"route file path")
		("path",
			po::value<std::vector<std::string>>()->value_name("path"),
			"path to resolve, read from standard input if none")
		("help,h", "print help and exit")
		("version,v", "print version and exit");

	return desc;
}
}

CommandLineParser::CommandLineParser():
	desc{ make_desc() }
{
	positional.add("path", -1);
}

auto CommandLineParser::parse(int argc, const char* const argv[]) const -> CommandLine
{
	namespace po = boost::program_options;
	namespace style = po::command_line_style;

	CommandLine result;
	auto options = po::command_line_parser{ argc, argv }
		.options(desc)
		.positional(positional)
		.style(style::default_style & ~style::allow_guessing)
		.run();
	store(options, result.vars);
	notify(result.vars);

	return result;
}

auto CommandLineParser::print_options(std::ostream& stream) const -> void
{
	stream << desc;
}

auto CommandLine::has(const std::string& parameter) const noexcept -> bool
{
	return vars.count(parameter) > 0;
}

auto CommandLine::to_parameters() const -> Parameters
{
	Parameters p;
	p.config_path = vars["config"].as<std::string>();
	if (has("path"))
		p.paths = vars["path"].as<std::vector<std::string>>();

	return p;
}
