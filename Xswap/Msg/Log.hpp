#ifndef XSWAP_MSG_LOG_HPP
#define XSWAP_MSG_LOG_HPP

#include"Xswap/log.hpp"
#include<string>

namespace Xswap { namespace Msg {

/** struct Xswap::Msg::Log
 *
 * @brief emitted by `Xswap::log`.
 */
struct Log {
	LogLevel level;
	std::string message;
};

}}

#endif /* !defined(XSWAP_MSG_LOG_HPP) */
