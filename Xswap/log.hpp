#ifndef XSWAP_LOG_HPP
#define XSWAP_LOG_HPP

#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Xswap {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

char const* to_string(LogLevel);
/* Throws std::invalid_argument on an unknown name.  */
LogLevel log_level_from_string(std::string const&);

/** Xswap::log
 *
 * @brief formats the message printf-style and
 * raises it on the bus as an `Xswap::Msg::Log`.
 */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
#if defined(__GNUC__)
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* XSWAP_LOG_HPP */
