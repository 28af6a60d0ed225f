#ifndef AUCTION_RATE_HPP
#define AUCTION_RATE_HPP

#include<cstdint>
#include<string>

namespace Auction {

/* Fixed-point scale of the interpolation progress.  */
std::uint64_t const SCALE = 1000000;
/* Rates are fixed point; this value is a rate of 1.0.  */
std::uint64_t const RATE_PRECISION = 1000000;

/** Auction::current_rate
 *
 * @brief computes the rate of a descending
 * (Dutch) auction at time `now`.
 *
 * @desc Gives exactly `start_rate` at or before
 * `start_time` and exactly `end_rate` at or after
 * `end_time`, interpolating linearly in between.
 * Integer-only, so every ledger and every observer
 * computes the same value.
 *
 * If `start_rate < end_rate` the result still moves
 * linearly from one to the other; callers validate
 * direction.
 */
std::uint64_t current_rate( std::uint64_t start_rate
			  , std::uint64_t end_rate
			  , std::uint64_t start_time
			  , std::uint64_t end_time
			  , std::uint64_t now
			  );

/** Auction::display_rate
 *
 * @brief renders a fixed-point rate as a decimal
 * string, e.g. 990000 as "0.990000".
 */
std::string display_rate(std::uint64_t rate);

}

#endif /* !defined(AUCTION_RATE_HPP) */
