#include "cmdline_parser.hpp"
#include "handler_registry.hpp"
#include "logger_imp.hpp"
#include "logs.hpp"
#include "options.hpp"
#include "resolver.hpp"
#include "route_file.hpp"
#include "router.hpp"
#include <iostream>
#include <exception>
#include <string>

namespace
{
struct RequestToQuit : std::exception {};

auto make_options(int argc, char *argv[])
{
	const auto parser = burrow::CommandLineParser{};
	const auto cmdline = parser.parse(argc, argv);
	if (cmdline.has("help")) {
		parser.print_options(std::cerr);
		throw RequestToQuit{};
	}
	if (cmdline.has("version")) {
		std::cerr << "burrow-route 0.1\n";
		throw RequestToQuit{};
	}

	return cmdline.to_options();
}

void run(const burrow::Options& opt)
{
	using namespace burrow;

	GlobalLogger lg{ "main"sv };
	Router router{ lg };
	const auto handlers = make_default_registry();

	const auto table = load_route_file(opt.routes_path);
	table.register_routes(router, *handlers);
	lg.info("loaded ", router.size(), " routes from ", opt.routes_path);

	Resolver resolver{ router, opt.dispatch, lg };
	if (!opt.requests.empty()) {
		for (auto& r : opt.requests)
			resolver.resolve(r, std::cout);
		return;
	}

	std::string line;
	while (std::getline(std::cin, line)) {
		const auto first = line.find_first_not_of(" \t\r");
		if (first == std::string::npos || line[first] == '#')
			continue;
		resolver.resolve(line, std::cout);
	}
}
}

int main(int argc, char *argv[])
{
	try {
		burrow::logs::preinit();
		auto opt = make_options(argc, argv);
		burrow::logs::init(opt.log);
		run(opt);
	} catch(RequestToQuit&) {
		// nothing to do
	} catch(std::exception &error) {
		std::cerr << argv[0] << ": " << error.what() << std::endl;
		return 1;
	}
}
