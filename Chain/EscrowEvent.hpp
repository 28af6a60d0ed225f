#ifndef CHAIN_ESCROWEVENT_HPP
#define CHAIN_ESCROWEVENT_HPP

#include"Htlc/Event.hpp"
#include<string>

namespace Chain {

/** struct Chain::EscrowEvent
 *
 * @brief a ledger event as delivered by an adapter,
 * tagged with the chain it came from.
 */
struct EscrowEvent {
	std::string chain;
	Htlc::Event event;
};

}

#endif /* !defined(CHAIN_ESCROWEVENT_HPP) */
