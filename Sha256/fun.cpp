#include"Sha256/fun.hpp"
#include<sodium.h>
#include<stdexcept>

namespace {

/* sodium_init is idempotent but must precede any
 * other libsodium call.  */
void ensure_init() {
	static auto initialized = false;
	if (initialized)
		return;
	if (sodium_init() < 0)
		throw std::runtime_error(
			"Sha256::fun: sodium_init failed"
		);
	initialized = true;
}

}

namespace Sha256 {

Sha256::Hash fun(void const* p, std::size_t len) {
	ensure_init();

	std::uint8_t out[crypto_hash_sha256_BYTES];
	crypto_hash_sha256( out
			  , (unsigned char const*) p
			  , (unsigned long long) len
			  );

	auto ret = Sha256::Hash();
	ret.from_buffer(out);
	sodium_memzero(out, sizeof(out));
	return ret;
}

}
