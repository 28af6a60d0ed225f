#ifndef XSWAP_MOD_LOGGER_HPP
#define XSWAP_MOD_LOGGER_HPP

#include"Xswap/log.hpp"
#include<ostream>

namespace S { class Bus; }

namespace Xswap { namespace Mod {

/** class Xswap::Mod::Logger
 *
 * @brief writes each `Xswap::Msg::Log` at or above
 * the minimum level as a JSON line.
 */
class Logger {
private:
	std::ostream& out;
	LogLevel min_level;

public:
	Logger() =delete;
	Logger(Logger const&) =delete;

	Logger( S::Bus& bus
	      , std::ostream& out
	      , LogLevel min_level = Info
	      );

	void set_level(LogLevel l) { min_level = l; }
};

}}

#endif /* !defined(XSWAP_MOD_LOGGER_HPP) */
