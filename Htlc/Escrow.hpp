#ifndef HTLC_ESCROW_HPP
#define HTLC_ESCROW_HPP

#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>

namespace Htlc {

/** struct Htlc::Escrow
 *
 * @brief value locked on one ledger against a
 * secret hash and a timelock.
 *
 * @desc `withdrawn` and `cancelled` are each set at
 * most once and never both.
 * Escrows are never deleted; terminal escrows remain
 * as ledger history.
 */
struct Escrow {
	Sha256::Hash escrow_id;
	std::string sender;
	std::string receiver;
	std::string resolver;
	std::uint64_t amount;
	/* Empty for the native asset.  */
	std::string asset;
	Sha256::Hash secret_hash;
	/* Absolute, in seconds since the epoch.  */
	std::uint64_t timelock;
	bool withdrawn;
	bool cancelled;
	std::string order_id;
	std::uint64_t created_at;
	std::uint64_t created_block;
	/* auction_end == auction_start means no auction.  */
	std::uint64_t auction_start;
	std::uint64_t auction_end;
	std::uint64_t start_rate;
	std::uint64_t end_rate;
	bool is_resolver_leg;
	/* For resolver legs, the paired escrow on the
	 * other ledger.  */
	Sha256::Hash source_escrow_id;

	bool terminal() const { return withdrawn || cancelled; }
	bool has_auction() const { return auction_end > auction_start; }
};

}

#endif /* !defined(HTLC_ESCROW_HPP) */
