#ifndef XSWAP_ORDER_HPP
#define XSWAP_ORDER_HPP

#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>

namespace Xswap {

/** struct Xswap::Order
 *
 * @brief a maker's swap intent, as tracked by the
 * coordinator.
 *
 * @desc `status` only ever moves forward, see
 * `Xswap::advance`.
 */
struct Order {
	enum Status
	{ Pending
	, AuctionActive
	, Accepted
	, Executing
	, Completed
	, Cancelled
	, Expired
	, Failed
	};

	std::string order_id;
	std::string maker;
	std::string receiver;
	std::string src_chain;
	std::string dest_chain;
	std::string src_asset;
	std::string dest_asset;
	std::uint64_t src_amount;
	std::uint64_t dest_amount;
	Sha256::Hash secret_hash;
	std::uint64_t timelock;
	std::uint64_t auction_start;
	std::uint64_t auction_end;
	std::uint64_t start_rate;
	std::uint64_t end_rate;
	Status status;

	Order() : src_amount(0)
		, dest_amount(0)
		, timelock(0)
		, auction_start(0)
		, auction_end(0)
		, start_rate(0)
		, end_rate(0)
		, status(Pending)
		{ }

	bool terminal() const {
		return status == Completed || status == Cancelled
		    || status == Expired || status == Failed
		     ;
	}
};

char const* to_string(Order::Status);

/** Xswap::advance
 *
 * @brief moves the order to `to` if that is a
 * forward transition; returns whether it moved.
 *
 * @desc A terminal order never moves again.
 */
bool advance(Order& order, Order::Status to);

}

#endif /* !defined(XSWAP_ORDER_HPP) */
