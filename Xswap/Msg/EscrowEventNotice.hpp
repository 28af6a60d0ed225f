#ifndef XSWAP_MSG_ESCROWEVENTNOTICE_HPP
#define XSWAP_MSG_ESCROWEVENTNOTICE_HPP

#include"Chain/EscrowEvent.hpp"

namespace Xswap { namespace Msg {

/** struct Xswap::Msg::EscrowEventNotice
 *
 * @brief feed notification for each ledger event
 * the coordinator processed.
 */
struct EscrowEventNotice {
	Chain::EscrowEvent event;
};

}}

#endif /* !defined(XSWAP_MSG_ESCROWEVENTNOTICE_HPP) */
