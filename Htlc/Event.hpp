#ifndef HTLC_EVENT_HPP
#define HTLC_EVENT_HPP

#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>

namespace Htlc {

/** struct Htlc::Event
 *
 * @brief one entry of a ledger's event log.
 *
 * @desc Created events carry the full escrow terms,
 * Withdrawn events carry the revealed `secret` and
 * the `execution_rate`, Cancelled events carry the
 * `refund_amount`.
 * Fields that do not apply to the type are left
 * zero or empty.
 * `Unknown` is never produced by `Htlc::Ledger`; it
 * lets adapters pass through event kinds they cannot
 * decode.
 */
struct Event {
	enum Type
	{ Created
	, Withdrawn
	, Cancelled
	, Unknown
	};
	Type type;
	/* Raw name of the event for Unknown types.  */
	std::string type_name;

	Sha256::Hash escrow_id;
	std::string order_id;
	std::string sender;
	std::string receiver;
	std::string resolver;
	std::uint64_t amount;
	std::string asset;
	Sha256::Hash secret_hash;
	std::uint64_t timelock;
	std::uint64_t auction_start;
	std::uint64_t auction_end;
	std::uint64_t start_rate;
	std::uint64_t end_rate;
	bool is_resolver_leg;
	Sha256::Hash source_escrow_id;

	std::string secret;
	std::uint64_t execution_rate;
	std::uint64_t refund_amount;

	std::uint64_t block_number;
	Sha256::Hash tx_hash;

	Event() : type(Unknown)
		, amount(0)
		, timelock(0)
		, auction_start(0)
		, auction_end(0)
		, start_rate(0)
		, end_rate(0)
		, is_resolver_leg(false)
		, execution_rate(0)
		, refund_amount(0)
		, block_number(0)
		{ }
};

char const* to_string(Event::Type);

}

#endif /* !defined(HTLC_EVENT_HPP) */
