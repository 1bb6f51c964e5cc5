#define BOOST_SPIRIT_X3_NO_FILESYSTEM
#include "route_file.hpp"
#include "handler_registry.hpp"
#include "route_error.hpp"
#include "router.hpp"
#include "string_view.hpp"
#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/ast/position_tagged.hpp>
#include <boost/spirit/home/x3/support/utility/annotate_on_success.hpp>
#include <boost/spirit/home/x3/support/utility/error_reporting.hpp>
#include <boost/fusion/adapted/struct/adapt_struct.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace
{
namespace ast
{
namespace x3 = boost::spirit::x3;

struct Decl : x3::position_tagged
{
	std::string method;
	std::string pattern;
	std::string handler;
};
}

namespace grammar
{
using namespace boost::spirit::x3;

struct DeclId : annotate_on_success {};

const rule<class MethodId, std::string> method = "method";
const rule<class PatternId, std::string> pattern = "pattern";
const rule<class HandlerId, std::string> handler = "handler name";
const rule<DeclId, ast::Decl> decl = "route";

const auto method_def = lexeme[+upper];
const auto pattern_def = lexeme[char_('/') >> *(graph - '#')];
const auto handler_def = lexeme[(alpha | char_('_')) >> *(alnum | char_("-_."))];
const auto decl_def = method > pattern > handler;

BOOST_SPIRIT_DEFINE(method, pattern, handler, decl);
}

using Iterator = burrow::string_view::const_iterator;

const burrow::string_view any_method = "ANY";

auto read(const std::string& path)
{
	std::ifstream f{ path,  std::ios::in | std::ios::binary | std::ios::ate };
	if (!f.is_open())
		throw burrow::RouteFile::Error{ "can't load route file: " + path };

	auto size = f.tellg();
	f.seekg(0, std::ios::beg);
	std::string data(size, 0);
	if (!f.read(data.data(), size))
		throw burrow::RouteFile::Error{ "can't read route file: " + path };

	return data;
}

auto is_blank(char c) noexcept
{
	return c == ' ' || c == '\t';
}
}

BOOST_FUSION_ADAPT_STRUCT(ast::Decl, method, pattern, handler);

namespace burrow
{
struct RouteFile::Priv
{
	Priv(std::string text, const std::string& filename):
		data{ std::move(text) },
		error_handler{ view().begin(), view().end(), error_stream, filename }
	{
	}

	auto view() const noexcept -> string_view { return data; }

	auto make_error_string(const grammar::position_tagged& where, const std::string& what) const
	{
		error_stream.str({});
		error_handler(where, what);
		return error_stream.str();
	}

	auto make_error_string(Iterator where, const std::string& what) const
	{
		error_stream.str({});
		error_handler(where, what);
		return error_stream.str();
	}

	auto make_error(Iterator where, const std::string& msg) const
	{
		return SyntaxError{ static_cast<SyntaxError::Position>(where - view().begin()),
			make_error_string(where, msg) };
	}

	auto parse_line(Iterator first, Iterator last, std::size_t line) -> void;

	const std::string data;
	mutable std::stringstream error_stream{ std::ios::out };
	grammar::error_handler<Iterator> error_handler;
	std::vector<ast::Decl> decls;
	std::vector<Entry> entries;
};

auto RouteFile::Priv::parse_line(Iterator first, Iterator last, std::size_t line) -> void
{
	auto begin = std::find_if_not(first, last, is_blank);
	if (begin == last || *begin == '#')
		return;

	auto parser = grammar::with<grammar::error_handler_tag>(std::ref(error_handler))
	[
		grammar::decl
	];

	ast::Decl d;
	try {
		if (!phrase_parse(begin, last, parser, grammar::blank, d))
			throw make_error(begin, "route expected:");
	} catch (grammar::expectation_failure<Iterator>& e) {
		throw make_error(std::find_if_not(e.where(), last, is_blank),
			"Error! Expecting " + e.which() + " here:");
	}

	// trailing comment
	if (begin != last && *begin != '#')
		throw make_error(begin, "can't parse:");

	entries.push_back({ d.method, d.pattern, d.handler, line });
	decls.push_back(std::move(d));
}

RouteFile::RouteFile(std::string data, const std::string& filename):
	p{ std::make_unique<Priv>(std::move(data), filename) }
{
	const auto text = p->view();
	auto first = text.begin();
	std::size_t line = 1;
	while (first != text.end()) {
		auto eol = std::find(first, text.end(), '\n');
		auto last = eol;
		if (last != first && *(last - 1) == '\r')
			--last;

		p->parse_line(first, last, line);

		first = eol == text.end() ? eol : eol + 1;
		++line;
	}
}

RouteFile::RouteFile(RouteFile&&) noexcept = default;

RouteFile::~RouteFile() = default;

auto RouteFile::entries() const noexcept -> const std::vector<Entry>&
{
	return p->entries;
}

auto RouteFile::register_routes(Router& router, const HandlerRegistry& handlers) const -> void
{
	for (std::size_t i = 0; i < p->entries.size(); ++i) {
		const auto& e = p->entries[i];
		const auto& where = p->decls[i];

		auto h = handlers[e.handler];
		if (!h)
			throw Error{ p->make_error_string(where, "unknown handler '" + e.handler + "'") };

		try {
			if (e.method == any_method)
				router.any(e.pattern, std::move(h));
			else
				router.handle(e.method, e.pattern, std::move(h));
		} catch (RouteError& err) {
			throw Error{ p->make_error_string(where, err.what()) };
		}
	}
}

auto load_route_file(const std::string& path) -> RouteFile
{
	return RouteFile{ read(path), path };
}
}
