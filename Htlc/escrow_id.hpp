#ifndef HTLC_ESCROW_ID_HPP
#define HTLC_ESCROW_ID_HPP

#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>

namespace Htlc {

/** Htlc::escrow_id
 *
 * @brief derives the identifier of an escrow from
 * its terms.
 *
 * @desc A pure function of its arguments, so any
 * observer holding the order parameters can recompute
 * the id without access to the ledger.
 * `timelock` is the absolute timelock.
 */
Sha256::Hash escrow_id( std::string const& sender
		      , std::string const& receiver
		      , std::string const& asset
		      , std::uint64_t amount
		      , Sha256::Hash const& secret_hash
		      , std::uint64_t timelock
		      , std::string const& order_id
		      );

}

#endif /* !defined(HTLC_ESCROW_ID_HPP) */
