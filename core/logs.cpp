#include "logs.hpp"
#include "logger_imp.hpp"
#include "string_view.hpp"
#include <boost/log/core/core.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/expressions/formatters/if.hpp>
#include <boost/log/expressions/formatters/stream.hpp>
#include <boost/log/expressions/predicates/has_attr.hpp>
#include <boost/phoenix/operator.hpp>
#include <array>
#include <iostream>
#include <stdexcept>
#include <string>

namespace burrow
{
Logger::Severity log_severity_level = Logger::Severity::info;

constexpr std::array severity_strings = {
	"!!! "sv,
	"ERR "sv,
	"WRN "sv,
	"INF "sv,
	"DBG "sv,
	"TRC "sv,
};

static std::ostream &operator<<(std::ostream& s, Logger::Severity sev)
{
	return s << severity_strings[static_cast<int>(sev)];
}

static std::ostream &operator<<(std::ostream& s, LoggerImp::Message msg)
{
	for (auto c = msg.first; c; c = c->next)
		c->print(s);
	return s;
}

namespace
{
static_assert(severity_strings[static_cast<int>(Logger::Severity::error)] == "ERR "sv);
static_assert(severity_strings[static_cast<int>(Logger::Severity::trace)] == "TRC "sv);

Logger::Severity convert(Options::Log::Severity s)
{
	using opt = Options::Log::Severity;
	using lg = Logger::Severity;
	switch (s) {
	case opt::trace: return lg::trace;
	case opt::debug: return lg::debug;
	case opt::info: return lg::info;
	case opt::warning: return lg::warning;
	case opt::error: return lg::error;
	}
	return lg::error;
}

BOOST_LOG_ATTRIBUTE_KEYWORD(kw_lazymessage, LoggerImp::attr_name.lazy_message,
	LoggerImp::Message)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_severity, LoggerImp::attr_name.severity, Logger::Severity)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_component, LoggerImp::attr_name.component, string_view)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_method, LoggerImp::attr_name.method, string_view)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_path, LoggerImp::attr_name.path, string_view)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_handler, LoggerImp::attr_name.handler, string_view)

template <typename Fmt>
struct LogAdder
{
	explicit LogAdder(Fmt fmt) : fmt{ fmt } {}

	void operator()(const Options::Log::Console&) const
	{
		boost::log::add_console_log(std::clog, fmt);
	}
	void operator()(const Options::Log::File& f) const
	{
		using namespace boost::log;

		add_file_log(
			keywords::file_name = f.path,
			keywords::auto_flush = true,
			fmt
		);
	}
	Fmt fmt;
};

void add_messages_sink(const decltype(Options::Log::dest)& dest)
{
	using namespace boost::log;

	visit(LogAdder{
		keywords::format = expressions::stream
			<< kw_severity
			<< if_(has_attr(kw_component))
			[
				expressions::stream << "[" << kw_component << "] "
			]
			<< if_(has_attr(kw_method))
			[
				expressions::stream << kw_method << " " << kw_path << " "
			]
			<< if_(has_attr(kw_handler))
			[
				expressions::stream << "(" << kw_handler << ") "
			]
			<< kw_lazymessage
		}, dest);
}
}

void logs::preinit()
{
	add_messages_sink(Options::Log::Console{});
}

void logs::init(const Options::Log& opt)
{
	using namespace boost::log;

	const auto level = convert(opt.level);
	if (level > Logger::severity_barrier)
		throw std::runtime_error{ "requested log level ("
			+ std::to_string(static_cast<int>(level))
			+ ") is too high, supported: "
			+ std::to_string(BURROW_LOG_LEVEL)};

	log_severity_level = level;

	core::get()->remove_all_sinks();
	add_messages_sink(opt.dest);
}
}
