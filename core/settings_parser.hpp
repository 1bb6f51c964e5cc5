#pragma once
#include <boost/program_options/options_description.hpp>
#include <istream>

namespace burrow
{
struct Options;

/*
	[dispatch]
	redirect_trailing_slash = true
	redirect_fixed_path = true
	handle_method_not_allowed = true
	body_404 = 404 page not found
	body_405 = 405 method not allowed

	[log]
	level = info
	messages = console
 */
class SettingsParser
{
public:
	SettingsParser();
	// Overrides the fields present in `in`; throws Options::Error
	auto parse(std::istream& in, Options& opt) const -> void;

private:
	const boost::program_options::options_description desc;
};
}
