#ifndef XSWAP_MSG_TIMERRECOVERYSCAN_HPP
#define XSWAP_MSG_TIMERRECOVERYSCAN_HPP

namespace Xswap { namespace Msg {

/** struct Xswap::Msg::TimerRecoveryScan
 *
 * @brief emitted by `Xswap::Mod::Timers` every recovery-scan interval.
 */
struct TimerRecoveryScan { };

}}

#endif /* !defined(XSWAP_MSG_TIMERRECOVERYSCAN_HPP) */
