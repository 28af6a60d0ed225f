#include"Htlc/escrow_id.hpp"
#include"Sha256/fun.hpp"
#include<vector>

namespace {

void put_u64(std::vector<std::uint8_t>& buf, std::uint64_t v) {
	for (auto i = 0; i < 8; ++i)
		buf.push_back(std::uint8_t((v >> (8 * (7 - i))) & 0xFF));
}
/* Length-prefixed, so no two field lists serialize
 * to the same bytes.  */
void put_str(std::vector<std::uint8_t>& buf, std::string const& s) {
	put_u64(buf, s.size());
	buf.insert(buf.end(), s.begin(), s.end());
}
void put_hash(std::vector<std::uint8_t>& buf, Sha256::Hash const& h) {
	std::uint8_t d[32];
	h.to_buffer(d);
	buf.insert(buf.end(), d, d + 32);
}

}

namespace Htlc {

Sha256::Hash escrow_id( std::string const& sender
		      , std::string const& receiver
		      , std::string const& asset
		      , std::uint64_t amount
		      , Sha256::Hash const& secret_hash
		      , std::uint64_t timelock
		      , std::string const& order_id
		      ) {
	auto buf = std::vector<std::uint8_t>();
	put_str(buf, sender);
	put_str(buf, receiver);
	put_str(buf, asset);
	put_u64(buf, amount);
	put_hash(buf, secret_hash);
	put_u64(buf, timelock);
	put_str(buf, order_id);
	return Sha256::fun(buf.data(), buf.size());
}

}
