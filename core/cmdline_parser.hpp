#pragma once
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>
#include <string>
#include <ostream>

namespace burrow
{
struct Options;

class CommandLine
{
public:
	auto has(const std::string &parameter) const noexcept -> bool;
	// Reads the settings file if one is given; throws Options::Error
	auto to_options() const -> Options;
	// Same, with the settings already opened
	auto to_options(std::istream& settings) const -> Options;

private:
	auto apply(Options& opt) const -> void;

	boost::program_options::variables_map vars;
	friend class CommandLineParser;
};

class CommandLineParser
{
public:
	CommandLineParser();
	// throws std::logic_error
	auto parse(int argc, const char *const argv[]) const -> CommandLine;
	auto print_options(std::ostream &stream) const -> void;

private:
	const boost::program_options::options_description desc;
	const boost::program_options::options_description hidden;
	boost::program_options::positional_options_description positional;
};
}
