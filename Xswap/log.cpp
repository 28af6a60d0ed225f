#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include"Xswap/Msg/Log.hpp"
#include"Xswap/log.hpp"
#include<stdarg.h>
#include<stdexcept>

namespace Xswap {

char const* to_string(LogLevel l) {
	switch (l) {
	case Trace: return "trace";
	case Debug: return "debug";
	case Info: return "info";
	case Warn: return "warn";
	case Error: return "error";
	}
	return "unknown";
}

LogLevel log_level_from_string(std::string const& s) {
	if (s == "trace")
		return Trace;
	if (s == "debug")
		return Debug;
	if (s == "info")
		return Info;
	if (s == "warn")
		return Warn;
	if (s == "error")
		return Error;
	throw std::invalid_argument(
		"Unknown log level: " + s
	);
}

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...) {
	va_list ap;

	auto msg = std::string();

	va_start(ap, fmt);
	msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	return bus.raise(Xswap::Msg::Log{l, std::move(msg)});
}

}
