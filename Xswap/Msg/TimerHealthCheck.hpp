#ifndef XSWAP_MSG_TIMERHEALTHCHECK_HPP
#define XSWAP_MSG_TIMERHEALTHCHECK_HPP

namespace Xswap { namespace Msg {

/** struct Xswap::Msg::TimerHealthCheck
 *
 * @brief emitted by `Xswap::Mod::Timers` every health-check interval.
 */
struct TimerHealthCheck { };

}}

#endif /* !defined(XSWAP_MSG_TIMERHEALTHCHECK_HPP) */
