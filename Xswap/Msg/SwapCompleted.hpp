#ifndef XSWAP_MSG_SWAPCOMPLETED_HPP
#define XSWAP_MSG_SWAPCOMPLETED_HPP

#include"Xswap/CrossChainSwap.hpp"
#include"Xswap/Order.hpp"

namespace Xswap { namespace Msg {

/** struct Xswap::Msg::SwapCompleted
 *
 * @brief emitted when both legs of a swap are
 * settled.
 */
struct SwapCompleted {
	Xswap::Order order;
	Xswap::CrossChainSwap swap;
};

}}

#endif /* !defined(XSWAP_MSG_SWAPCOMPLETED_HPP) */
