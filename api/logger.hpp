#pragma once
#include <ostream>
#include <utility>

#ifndef PATHMUX_LOG_LEVEL
#  define PATHMUX_LOG_LEVEL 3
#endif

static_assert(PATHMUX_LOG_LEVEL >= 1 && PATHMUX_LOG_LEVEL <= 5,
	"log level should be in [1(error), 5(trace)]");

// Two channels: severity-tagged messages, and one resolution record per
// resolved path. Arguments are captured as a chain of printers and formatted
// only when a sink takes the record.
class Logger
{
public:
	enum class Severity
	{
		error   = 1,
		warning = 2,
		info    = 3,
		debug   = 4,
		trace   = 5,
	};

	static constexpr Severity severity_barrier = Severity{ PATHMUX_LOG_LEVEL };

	// calls above the barrier are compiled out
	static constexpr bool compiled_in(Severity s) noexcept
	{
		return s <= severity_barrier;
	}

	template <typename... Args> void error(Args&&... args);
	template <typename... Args> void warning(Args&&... args);
	template <typename... Args> void info(Args&&... args);
	template <typename... Args> void debug(Args&&... args);
	template <typename... Args> void trace(Args&&... args);

	template <Severity S, typename... Args> void message(Args&&... args);

	// compiled out with PATHMUX_NO_RESOLUTION_LOG
	template <typename... Args> void resolution(Args&&... args);

	struct BasePrinter
	{
		virtual ~BasePrinter() = default;
		virtual void print(std::ostream& stream) const = 0;

		BasePrinter* next{};
	};

	template <typename T>
	class Printer: public BasePrinter
	{
	public:
		explicit Printer(const T& value) noexcept: value{ value } {}

		void print(std::ostream& stream) const override
		{
			stream << value;
		}

	private:
		const T& value;
	};

	Logger(Logger&& rhs) = delete;

	Logger& operator=(const Logger& rhs) = delete;
	Logger& operator=(Logger&& rhs) = delete;

protected:
	Logger() = default;
	Logger(const Logger& rhs) = default;
	~Logger() = default;

	template <typename... Args> void capture(Args&&...);
	template <typename T, typename... Args>
	void capture(T&& a, Args&&... args);

private:
	bool open(Severity s);
	bool open_resolution();
	void push(BasePrinter& p) noexcept;
};

template <typename... Args>
void Logger::error(Args&&... args)
{
	message<Severity::error>(std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::warning(Args&&... args)
{
	message<Severity::warning>(std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::info(Args&&... args)
{
	message<Severity::info>(std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::debug(Args&&... args)
{
	message<Severity::debug>(std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::trace(Args&&... args)
{
	message<Severity::trace>(std::forward<Args>(args)...);
}

template <Logger::Severity S, typename... Args>
void Logger::message(Args&&... args)
{
	if constexpr(compiled_in(S))
		if (open(S))
			capture(std::forward<Args>(args)...);
}

template <typename... Args>
void Logger::resolution([[maybe_unused]] Args&&... args)
{
#ifndef PATHMUX_NO_RESOLUTION_LOG
	if (open_resolution())
		capture(std::forward<Args>(args)...);
#endif
}

// printers live on the stack until the record is pushed
template <typename T, typename... Args>
void Logger::capture(T&& a, Args&&... args)
{
	Printer<T> p{ a };
	push(p);
	capture(std::forward<Args>(args)...);
}

template <> void Logger::capture<>();
