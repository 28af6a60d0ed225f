#undef NDEBUG
#include"Auction/rate.hpp"
#include<assert.h>

int main() {
	/* Endpoints are exact.  */
	assert(Auction::current_rate(1000000, 990000, 100, 200, 50) == 1000000);
	assert(Auction::current_rate(1000000, 990000, 100, 200, 100) == 1000000);
	assert(Auction::current_rate(1000000, 990000, 100, 200, 200) == 990000);
	assert(Auction::current_rate(1000000, 990000, 100, 200, 1000) == 990000);

	/* Linear in between.  */
	assert(Auction::current_rate(1000000, 990000, 100, 200, 150) == 995000);
	assert(Auction::current_rate(1000000, 990000, 100, 200, 110) == 999000);
	assert(Auction::current_rate(1000000, 990000, 100, 200, 190) == 991000);

	/* Non-increasing over the window.  */
	auto prev = Auction::current_rate(2000000, 1000000, 0, 3600, 0);
	for (auto t = std::uint64_t(1); t <= 3600; ++t) {
		auto r = Auction::current_rate(2000000, 1000000, 0, 3600, t);
		assert(r <= prev);
		assert(r >= 1000000);
		prev = r;
	}

	/* Flat auction.  */
	assert(Auction::current_rate(500000, 500000, 10, 20, 15) == 500000);

	/* Large values do not overflow.  */
	auto big = std::uint64_t(1) << 62;
	assert(Auction::current_rate(big, big / 2, 0, 100, 50) == big - big / 4);
	assert(Auction::current_rate(big, big / 2, 0, 100, 100) == big / 2);

	/* Rising rates still interpolate.  */
	assert(Auction::current_rate(100, 200, 0, 10, 5) == 150);

	assert(Auction::display_rate(990000) == "0.990000");
	assert(Auction::display_rate(1000000) == "1.000000");
	assert(Auction::display_rate(2500001) == "2.500001");
	assert(Auction::display_rate(0) == "0.000000");

	return 0;
}
