#undef NDEBUG
#include"Chain/Config.hpp"
#include<assert.h>

namespace {

bool fails(std::string const& text) {
	try {
		Chain::parse_config(text);
	} catch (Chain::ConfigError const&) {
		return true;
	}
	return false;
}

}

int main() {
	auto c = Chain::parse_config("etherlink");
	assert(c.name == "etherlink");
	assert(c.chain_id == 42793);
	assert(c.confirmations == 2);
	assert(c.block_time == 0.5);
	assert(c.endpoint == "local");
	assert(c.account == "relayer");

	/* Per-chain confirmation depth.  */
	assert(Chain::parse_config("monad").confirmations == 3);
	assert(Chain::parse_config("ethereum").confirmations == 12);

	c = Chain::parse_config("monad: confirmations=5, block-time=0.25,account=0xabc");
	assert(c.chain_id == 1337);
	assert(c.confirmations == 5);
	assert(c.block_time == 0.25);
	assert(c.account == "0xabc");

	c = Chain::parse_config("devnet:id=31337");
	assert(c.name == "devnet");
	assert(c.chain_id == 31337);
	assert(c.confirmations == 1);

	assert(fails(""));
	assert(fails(":id=1"));
	assert(fails("devnet"));
	assert(fails("monad:bogus=1"));
	assert(fails("monad:confirmations"));
	assert(fails("monad:confirmations=0"));
	assert(fails("monad:confirmations=many"));
	assert(fails("monad:block-time=-1"));
	assert(fails("monad:account="));

	return 0;
}
