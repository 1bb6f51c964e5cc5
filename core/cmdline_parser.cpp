#include "cmdline_parser.hpp"
#include "options.hpp"
#include "settings_parser.hpp"
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/cmdline.hpp>
#include <fstream>
#include <vector>

namespace burrow
{
namespace
{
auto make_desc()
{
	namespace po = boost::program_options;

	po::options_description desc{ "burrow-route resolves requests against a route table.\n"
		"Usage: burrow-route -r routes.conf [options] [\"METHOD PATH\"...]\nOptions are" };
	desc.add_options()
		("routes,r",
			po::value<std::string>()->value_name("path"),
			"route table file")
		("settings,s",
			po::value<std::string>()->value_name("path"),
			"settings file")
		("no-redirect-trailing-slash", "don't redirect on a trailing slash mismatch")
		("no-redirect-fixed-path", "don't redirect to the case-insensitive match")
		("no-method-not-allowed", "answer 404 instead of 405")
		("log-level",
			po::value<std::string>()->value_name("level"),
			"error, warning, info, debug or trace")
		("log-file",
			po::value<std::string>()->value_name("path"),
			"log to a file instead of the console")
		("help,h", "print help and exit")
		("version,v", "print version and exit");

	return desc;
}

auto make_hidden()
{
	namespace po = boost::program_options;

	po::options_description desc;
	desc.add_options()
		("request", po::value<std::vector<std::string>>(), "request to resolve");
	return desc;
}
}

CommandLineParser::CommandLineParser():
	desc{ make_desc() },
	hidden{ make_hidden() }
{
	positional.add("request", -1);
}

auto CommandLineParser::parse(int argc, const char *const argv[]) const -> CommandLine
{
	namespace po = boost::program_options;
	namespace style = po::command_line_style;

	po::options_description all;
	all.add(desc).add(hidden);

	CommandLine result;
	auto options = po::command_line_parser(argc, argv)
		.options(all)
		.positional(positional)
		.style(style::default_style & ~style::allow_guessing)
		.run();
	store(options, result.vars);
	notify(result.vars);

	return result;
}

auto CommandLineParser::print_options(std::ostream &stream) const -> void
{
	stream << desc;
}

auto CommandLine::has(const std::string &parameter) const noexcept -> bool
{
	return vars.count(parameter) > 0;
}

auto CommandLine::to_options() const -> Options
{
	Options opt;
	if (has("settings")) {
		const auto& path = vars["settings"].as<std::string>();
		std::ifstream f{ path };
		if (!f.is_open())
			throw Options::Error{ "can't open settings file: " + path };
		SettingsParser{}.parse(f, opt);
		opt.settings_path = path;
	}
	apply(opt);
	return opt;
}

auto CommandLine::to_options(std::istream& settings) const -> Options
{
	Options opt;
	SettingsParser{}.parse(settings, opt);
	apply(opt);
	return opt;
}

auto CommandLine::apply(Options& opt) const -> void
{
	if (!has("routes"))
		throw Options::Error{ "route file is not specified" };
	opt.routes_path = vars["routes"].as<std::string>();

	if (has("no-redirect-trailing-slash"))
		opt.dispatch.redirect_trailing_slash = false;
	if (has("no-redirect-fixed-path"))
		opt.dispatch.redirect_fixed_path = false;
	if (has("no-method-not-allowed"))
		opt.dispatch.handle_method_not_allowed = false;

	if (has("log-level"))
		opt.log.level = parse_severity(vars["log-level"].as<std::string>());
	if (has("log-file"))
		opt.log.dest = Options::Log::File{ vars["log-file"].as<std::string>() };

	if (has("request"))
		opt.requests = vars["request"].as<std::vector<std::string>>();
}
}
