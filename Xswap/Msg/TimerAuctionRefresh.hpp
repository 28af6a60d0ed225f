#ifndef XSWAP_MSG_TIMERAUCTIONREFRESH_HPP
#define XSWAP_MSG_TIMERAUCTIONREFRESH_HPP

namespace Xswap { namespace Msg {

/** struct Xswap::Msg::TimerAuctionRefresh
 *
 * @brief emitted by `Xswap::Mod::Timers` every auction-refresh interval.
 */
struct TimerAuctionRefresh { };

}}

#endif /* !defined(XSWAP_MSG_TIMERAUCTIONREFRESH_HPP) */
