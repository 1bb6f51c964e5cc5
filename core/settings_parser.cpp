#include "settings_parser.hpp"
#include "options.hpp"
#include <boost/program_options/errors.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>
#include <string>

namespace burrow
{
namespace
{
auto make_desc()
{
	namespace po = boost::program_options;

	po::options_description desc;
	desc.add_options()
		("dispatch.redirect_trailing_slash", po::value<bool>())
		("dispatch.redirect_fixed_path", po::value<bool>())
		("dispatch.handle_method_not_allowed", po::value<bool>())
		("dispatch.body_404", po::value<std::string>())
		("dispatch.body_405", po::value<std::string>())
		("log.level", po::value<std::string>())
		("log.messages", po::value<std::string>());
	return desc;
}

template <typename T>
void assign(const boost::program_options::variables_map& vars, const char* key, T& to)
{
	if (vars.count(key))
		to = vars[key].as<T>();
}
}

SettingsParser::SettingsParser():
	desc{ make_desc() }
{
}

auto SettingsParser::parse(std::istream& in, Options& opt) const -> void
{
	namespace po = boost::program_options;

	po::variables_map vars;
	try {
		store(po::parse_config_file(in, desc), vars);
		notify(vars);
	} catch (po::error& e) {
		throw Options::Error{ std::string{ "settings: " } + e.what() };
	}

	assign(vars, "dispatch.redirect_trailing_slash", opt.dispatch.redirect_trailing_slash);
	assign(vars, "dispatch.redirect_fixed_path", opt.dispatch.redirect_fixed_path);
	assign(vars, "dispatch.handle_method_not_allowed", opt.dispatch.handle_method_not_allowed);
	assign(vars, "dispatch.body_404", opt.dispatch.body_404);
	assign(vars, "dispatch.body_405", opt.dispatch.body_405);

	if (vars.count("log.level"))
		opt.log.level = parse_severity(vars["log.level"].as<std::string>());
	if (vars.count("log.messages"))
		opt.log.dest = parse_log_dest(vars["log.messages"].as<std::string>());
}
}
