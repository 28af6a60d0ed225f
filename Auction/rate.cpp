#include"Auction/rate.hpp"
#include<iomanip>
#include<sstream>

namespace {

/* a * num / SCALE, without overflowing when a is large.
 * num <= SCALE.  */
std::uint64_t scale_mul(std::uint64_t a, std::uint64_t num) {
	return (a / Auction::SCALE) * num
	     + ((a % Auction::SCALE) * num) / Auction::SCALE
	     ;
}

}

namespace Auction {

std::uint64_t current_rate( std::uint64_t start_rate
			  , std::uint64_t end_rate
			  , std::uint64_t start_time
			  , std::uint64_t end_time
			  , std::uint64_t now
			  ) {
	if (now >= end_time)
		return end_rate;
	if (now <= start_time)
		return start_rate;

	/* start_time < now < end_time here.  */
	auto elapsed = now - start_time;
	auto duration = end_time - start_time;
	auto progress = std::uint64_t();
	if (elapsed > (~std::uint64_t(0)) / SCALE)
		progress = elapsed / (duration / SCALE);
	else
		progress = (elapsed * SCALE) / duration;
	if (progress > SCALE)
		progress = SCALE;

	if (start_rate >= end_rate)
		return start_rate - scale_mul(start_rate - end_rate, progress);
	else
		return start_rate + scale_mul(end_rate - start_rate, progress);
}

std::string display_rate(std::uint64_t rate) {
	auto os = std::ostringstream();
	os << (rate / RATE_PRECISION) << "."
	   << std::setfill('0') << std::setw(6) << (rate % RATE_PRECISION)
	   ;
	return os.str();
}

}
