#include "logger.hpp"
#include "logger_imp.hpp"

namespace
{
LoggerImp* impl(Logger* lg)
{
	return static_cast<LoggerImp*>(lg);
}
}

bool Logger::open(Severity s)
{
	extern Severity log_severity_level;

	if (s > log_severity_level)
		return false;

	return impl(this)->open_message(s);
}

bool Logger::open_resolution()
{
	extern bool log_resolution_enabled;

	return log_resolution_enabled && impl(this)->open_stamped();
}

void Logger::push(BasePrinter& p) noexcept
{
	impl(this)->push(p);
}

template <> void Logger::capture<>()
{
	impl(this)->finalize();
}
