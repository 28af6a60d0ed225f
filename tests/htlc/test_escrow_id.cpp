#undef NDEBUG
#include"Htlc/escrow_id.hpp"
#include"Sha256/fun.hpp"
#include<assert.h>
#include<set>

int main() {
	auto h = Sha256::fun(std::string("secret"));
	auto base = Htlc::escrow_id("alice", "bob", "USDC", 100, h, 5000, "o1");

	/* Deterministic.  */
	assert(base == Htlc::escrow_id("alice", "bob", "USDC", 100, h, 5000, "o1"));
	assert(base);

	/* Every field matters.  */
	auto ids = std::set<Sha256::Hash>();
	ids.insert(base);
	ids.insert(Htlc::escrow_id("alicf", "bob", "USDC", 100, h, 5000, "o1"));
	ids.insert(Htlc::escrow_id("alice", "bop", "USDC", 100, h, 5000, "o1"));
	ids.insert(Htlc::escrow_id("alice", "bob", "USDT", 100, h, 5000, "o1"));
	ids.insert(Htlc::escrow_id("alice", "bob", "USDC", 101, h, 5000, "o1"));
	ids.insert(Htlc::escrow_id("alice", "bob", "USDC", 100, Sha256::Hash(), 5000, "o1"));
	ids.insert(Htlc::escrow_id("alice", "bob", "USDC", 100, h, 5001, "o1"));
	ids.insert(Htlc::escrow_id("alice", "bob", "USDC", 100, h, 5000, "o2"));
	assert(ids.size() == 8);

	/* Field boundaries are not ambiguous.  */
	assert( Htlc::escrow_id("ab", "c", "USDC", 1, h, 1, "o")
	     != Htlc::escrow_id("a", "bc", "USDC", 1, h, 1, "o")
	      );

	return 0;
}
