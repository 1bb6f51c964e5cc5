#include "logger.hpp"
#include "logger_imp.hpp"

namespace burrow
{
// runtime ceiling, set from the options
extern Logger::Severity log_severity_level;

namespace
{
LoggerImp *impl(Logger *lg)
{
	return static_cast<LoggerImp*>(lg);
}
}

bool Logger::open(Severity s)
{
	return s <= log_severity_level && impl(this)->open_message(s);
}

void Logger::push(const Fragment& f) noexcept
{
	impl(this)->push(f);
}

void Logger::finish()
{
	impl(this)->finalize();
}
}
