#ifndef HTLC_PARAMS_HPP
#define HTLC_PARAMS_HPP

#include<cstdint>

namespace Htlc {

/** struct Htlc::Params
 *
 * @brief per-ledger protocol limits.
 */
struct Params {
	/* Bounds on timelockSeconds, inclusive.  */
	std::uint64_t min_timelock;
	std::uint64_t max_timelock;

	Params() : min_timelock(3600)
		 , max_timelock(172800)
		 { }
};

/* current_rate result for escrows without an auction.  */
std::uint64_t const NO_AUCTION = 0;

}

#endif /* !defined(HTLC_PARAMS_HPP) */
