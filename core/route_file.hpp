#pragma once
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace burrow
{
class HandlerRegistry;
class Router;

/*
	route    ::= METHOD PATTERN HANDLER [comment]
	comment  ::= '#' any*
	file     ::= (route | comment | blank)* separated by newlines
 */
class RouteFile
{
public:
	struct Error : std::runtime_error
	{
		explicit Error(const std::string& s):
			runtime_error{ s } {}
	};

	class SyntaxError : public Error
	{
	public:
		using Position = std::size_t;

		SyntaxError(Position where, const std::string &what):
			Error{ what },
			pos{ where }
		{}

		auto where() const noexcept -> Position { return pos; }

	private:
		const Position pos;
	};

	struct Entry
	{
		std::string method;
		std::string pattern;
		std::string handler;
		std::size_t line;
	};

	// throws SyntaxError
	explicit RouteFile(std::string data, const std::string& filename = {});
	RouteFile(RouteFile&&) noexcept;
	~RouteFile();

	auto entries() const noexcept -> const std::vector<Entry>&;

	// Registers every entry, "ANY" for all methods. Unknown handlers and
	// route conflicts throw Error pointing at the offending line.
	auto register_routes(Router& router, const HandlerRegistry& handlers) const -> void;

	struct Priv;

private:
	std::unique_ptr<Priv> p;
};

// throws RouteFile::Error if the file can't be read
auto load_route_file(const std::string& path) -> RouteFile;
}
