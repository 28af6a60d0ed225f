#undef NDEBUG
#include"Sha256/Hash.hpp"
#include<assert.h>
#include<cstdint>
#include<map>
#include<sstream>
#include<unordered_set>

namespace {

auto const one = std::string("0123456789012345678901234567890123456789012345678901234567890123");
auto const two = std::string("3210987654321098765432109876543210987654321098765432109876543210");

}

int main() {
	/* The empty hash is the all-zero hash, and false.  */
	auto none = Sha256::Hash();
	assert(!none);
	assert(none == Sha256::Hash("0000000000000000000000000000000000000000000000000000000000000000"));
	assert(std::string(none) == std::string(64, '0'));

	assert(Sha256::Hash::valid_string(one));
	assert(!Sha256::Hash::valid_string(one.substr(2)));
	assert(!Sha256::Hash::valid_string("zz" + one.substr(2)));

	auto a = Sha256::Hash(one);
	auto b = Sha256::Hash(two);
	assert(a);
	assert(a != b);
	assert(std::string(a) == one);
	assert(a < b);
	assert(!(b < a));
	assert(!(a < a));

	{
		auto os = std::ostringstream();
		os << b;
		assert(os.str() == two);
	}

	/* Buffers round out to the same value.  */
	{
		std::uint8_t buf[32];
		a.to_buffer(buf);
		assert(buf[0] == 0x01);
		assert(buf[31] == 0x23);
		auto c = Sha256::Hash();
		c.from_buffer(buf);
		assert(c == a);

		none.to_buffer(buf);
		for (auto i = 0; i < 32; ++i)
			assert(buf[i] == 0);
	}

	/* Usable as keys of either kind of map.  */
	{
		auto bag = std::unordered_set<Sha256::Hash>();
		bag.insert(Sha256::Hash(one));
		bag.insert(a);
		assert(bag.size() == 1);
		assert(bag.count(b) == 0);

		auto escrows = std::map<Sha256::Hash, std::string>();
		escrows[b] = "dst";
		escrows[a] = "src";
		assert(escrows.begin()->second == "src");
		assert(escrows.size() == 2);
	}

	/* Copies share nothing observable.  */
	{
		auto c = a;
		c = b;
		assert(a == Sha256::Hash(one));
	}

	return 0;
}
