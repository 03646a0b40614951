#define BOOST_SPIRIT_X3_NO_FILESYSTEM
#include "config_parser.hpp"
#include <boost/fusion/adapted/struct/adapt_struct.hpp>
#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/ast/position_tagged.hpp>
#include <boost/spirit/home/x3/support/ast/variant.hpp>
#include <boost/spirit/home/x3/support/utility/annotate_on_success.hpp>
#include <boost/spirit/home/x3/support/utility/error_reporting.hpp>
#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/static_visitor.hpp>
#include <algorithm>
#include <fstream>
#include <functional>
#include <sstream>
#include <utility>
#include <vector>

/*
	string  ::= 'quoted' | unquoted
	setting ::= string = string
	route   ::= route string string
	file    ::= (route | setting)*

	'#' starts a comment up to the end of line
 */

namespace
{
namespace ast
{
namespace x3 = boost::spirit::x3;

struct Setting: x3::position_tagged
{
	std::string key;
	std::string value;
};

struct Route: x3::position_tagged
{
	std::string path;
	std::string handler;
};

struct Statement: x3::variant<Route, Setting>
{
	using base_type::base_type;
	using base_type::operator=;
};

using File = std::vector<Statement>;
}

namespace grammar
{
using namespace boost::spirit::x3;

struct RouteId: annotate_on_success {};
struct SettingId: annotate_on_success {};

const rule<class KeyId, std::string> key = "key";
const rule<class ValueId, std::string> value = "value";
const rule<class PathId, std::string> path = "path";
const rule<class HandlerId, std::string> handler = "handler";
const rule<RouteId, ast::Route> route = "route";
const rule<SettingId, ast::Setting> setting = "setting";
const rule<class FileId, ast::File> file = "file";

const auto quoted_string = lexeme['\'' > *~char_('\'') > '\''];
const auto unquoted_string = lexeme[+(graph - char_("'=#"))];
const auto string = quoted_string | unquoted_string;
const auto route_kw = lexeme[lit("route") >> !graph];
const auto comment = '#' >> *(char_ - eol);
const auto skipper = space | comment;

const auto key_def = string;
const auto value_def = string;
const auto path_def = string;
const auto handler_def = string;
const auto route_def = route_kw > path > handler;
const auto setting_def = key > '=' > value;
const auto file_def = *(route | setting);

BOOST_SPIRIT_DEFINE(key, value, path, handler, route, setting, file);
}

using Iterator = string_view::const_iterator;

auto read(const std::filesystem::path& path)
{
	std::ifstream f{ path, std::ios::in | std::ios::binary | std::ios::ate };
	if (!f.is_open())
		throw config::Error{ "can't load route file: " + path.string() };

	auto size = f.tellg();
	f.seekg(0, std::ios::beg);
	std::string data(size, 0);
	if (!f.read(data.data(), size))
		throw config::Error{ "can't read route file: " + path.string() };

	return data;
}
}

BOOST_FUSION_ADAPT_STRUCT(ast::Setting, key, value)
BOOST_FUSION_ADAPT_STRUCT(ast::Route, path, handler)

namespace config
{
Error::Error(const std::string& msg): runtime_error{ msg }
{}

namespace
{
class Parser
{
public:
	Parser(string_view text, const std::string& name):
		text{ text },
		error_handler{ text.begin(), text.end(), error_stream, name }
	{}

	auto run(Document& doc)
	{
		auto begin = text.begin();
		auto end = text.end();

		auto parser = grammar::with<grammar::error_handler_tag>(std::ref(error_handler))
		[
			grammar::file
		];

		ast::File ast;
		try {
			grammar::phrase_parse(begin, end, parser, grammar::skipper, ast);
		} catch (grammar::expectation_failure<Iterator>& e) {
			throw make_error(e.where(), "Error! Expecting " + e.which() + " here:");
		}

		if (begin != end)
			throw make_error(begin, "can't parse:");

		StatementVisitor visitor{ *this, doc };
		for (auto& stmt: ast)
			boost::apply_visitor(visitor, stmt);
	}

private:
	struct StatementVisitor: boost::static_visitor<void>
	{
		StatementVisitor(const Parser& parser, Document& doc):
			parser{ parser },
			doc{ doc }
		{}

		void operator()(const ast::Route& r) const
		{
			doc.routes.push_back({ r.path, r.handler, parser.line_of(r) });
		}

		void operator()(const ast::Setting& s) const
		{
			doc.settings.push_back({ s.key, s.value, parser.line_of(s) });
		}

		const Parser& parser;
		Document& doc;
	};

	auto line_of(const grammar::position_tagged& node) const -> std::size_t
	{
		auto where = error_handler.position_of(node).begin();
		// blanks and comments before a statement may be tagged with it
		grammar::parse(where, text.end(), *grammar::skipper);
		return static_cast<std::size_t>(std::count(text.begin(), where, '\n')) + 1;
	}

	auto make_error(Iterator where, const std::string& msg) -> SyntaxError
	{
		error_handler(where, msg);
		return SyntaxError{ static_cast<SyntaxError::Position>(where - text.begin()),
			error_stream.str() };
	}

	const string_view text;
	std::stringstream error_stream{ std::ios::out };
	grammar::error_handler<Iterator> error_handler;
};
}

auto parse(string_view text, const std::string& name) -> Document
{
	Document doc{ name, {}, {} };
	Parser{ text, name }.run(doc);
	return doc;
}

auto load(const std::filesystem::path& path) -> Document
{
	const auto data = read(path);
	return parse(data, path.string());
}
}
