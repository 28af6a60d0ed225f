#ifndef XSWAP_MSG_AUCTIONUPDATE_HPP
#define XSWAP_MSG_AUCTIONUPDATE_HPP

#include<cstdint>
#include<string>

namespace Xswap { namespace Msg {

/** struct Xswap::Msg::AuctionUpdate
 *
 * @brief the current auction rate of an order,
 * emitted on every auction-refresh tick.
 */
struct AuctionUpdate {
	std::string order_id;
	std::uint64_t current_rate;
	std::uint64_t time_elapsed;
	std::uint64_t total_duration;
	/* 0 to 100.  */
	double percentage_complete;
	bool is_active;
};

}}

#endif /* !defined(XSWAP_MSG_AUCTIONUPDATE_HPP) */
