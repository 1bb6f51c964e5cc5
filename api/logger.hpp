#pragma once
#include "string_view.hpp"
#include <ostream>
#include <type_traits>
#include <utility>

#ifndef BURROW_LOG_LEVEL
#  define BURROW_LOG_LEVEL 3
#endif

static_assert(BURROW_LOG_LEVEL >= 1 && BURROW_LOG_LEVEL <= 5,
	"log level should be in [1(error), 5(trace)]");

namespace burrow
{
// Path or pattern printed in quotes, so that empty and blank ones show up
struct Quoted
{
	string_view s;
};

inline std::ostream& operator<<(std::ostream& stream, Quoted q)
{
	return stream << '\'' << q.s << '\'';
}

inline Quoted quoted(string_view s) noexcept
{
	return Quoted{ s };
}

// Arguments are kept by reference and printed only if a sink accepts the
// record. Messages above BURROW_LOG_LEVEL are compiled out.
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

	static constexpr Severity severity_barrier = Severity{ BURROW_LOG_LEVEL };

	template <typename... Args> void error(Args&&... args)
	{
		message<Severity::error>(std::forward<Args>(args)...);
	}
	template <typename... Args> void warning(Args&&... args)
	{
		message<Severity::warning>(std::forward<Args>(args)...);
	}
	template <typename... Args> void info(Args&&... args)
	{
		message<Severity::info>(std::forward<Args>(args)...);
	}
	template <typename... Args> void debug(Args&&... args)
	{
		message<Severity::debug>(std::forward<Args>(args)...);
	}
	template <typename... Args> void trace(Args&&... args)
	{
		message<Severity::trace>(std::forward<Args>(args)...);
	}

	template <Severity S, typename... Args> void message(Args&&... args)
	{
		if constexpr(S <= severity_barrier)
			if (open(S))
				print_all(std::forward<Args>(args)...);
	}

	// One argument of a pending record, chained in argument order
	struct Fragment
	{
		virtual ~Fragment() = default;
		virtual void print(std::ostream& stream) const = 0;

		mutable const Fragment* next{};
	};

	Logger(Logger&& rhs) = delete;

	Logger& operator=(const Logger& rhs) = delete;
	Logger& operator=(Logger&& rhs) = delete;

protected:
	Logger() = default;
	Logger(const Logger& rhs) = default;
	~Logger() = default;

private:
	template <typename T> class ArgFragment;

	void print_all() { finish(); }

	template <typename T, typename... Args>
	void print_all(T&& a, Args&&... args);

	bool open(Severity s);
	void push(const Fragment& f) noexcept;
	void finish();
};

template <typename T>
class Logger::ArgFragment : public Fragment
{
public:
	explicit ArgFragment(const T& arg) noexcept: arg{ arg } {}

	void print(std::ostream& stream) const override
	{
		stream << arg;
	}

private:
	const T& arg;
};

// Fragments live on the stack until finish() has printed the whole chain
template <typename T, typename... Args>
void Logger::print_all(T&& a, Args&&... args)
{
	const ArgFragment<std::remove_reference_t<T>> f{ a };
	push(f);
	print_all(std::forward<Args>(args)...);
}
}
