#undef NDEBUG
#include"Util/Str.hpp"
#include<assert.h>
#include<cstdint>
#include<stdexcept>

int main() {
	{
		std::uint8_t buf[] = {0x00, 0x7f, 0xab, 0xff};
		assert(Util::Str::hexdump(buf, sizeof(buf)) == "007fabff");
		assert(Util::Str::hexbyte(0x0a) == "0a");

		auto back = Util::Str::hexread("007fABff");
		assert(back.size() == 4);
		assert(back[2] == 0xab);
		assert(back[3] == 0xff);

		auto thrown = false;
		try {
			Util::Str::hexread("abc");
		} catch (Util::Str::HexParseFailure const&) {
			thrown = true;
		}
		assert(thrown);

		assert(Util::Str::ishex("deadBEEF"));
		assert(!Util::Str::ishex("dead-eef"));
		assert(!Util::Str::ishex("abc"));
	}

	{
		assert(Util::Str::trim("  etherlink \t\n") == "etherlink");
		assert(Util::Str::trim("   ") == "");

		auto parts = Util::Str::split("name=monad,id=1337,,x", ',');
		assert(parts.size() == 4);
		assert(parts[0] == "name=monad");
		assert(parts[2] == "");
		assert(Util::Str::split("", ',').empty());
		assert(Util::Str::split("a", ',').size() == 1);
	}

	{
		assert(Util::Str::to_u64("0") == 0);
		assert(Util::Str::to_u64("42793") == 42793);
		assert(Util::Str::to_u64("18446744073709551615") == 18446744073709551615ULL);
		auto bad = [](char const* s) {
			try {
				Util::Str::to_u64(s);
			} catch (std::invalid_argument const&) {
				return true;
			}
			return false;
		};
		assert(bad(""));
		assert(bad("-1"));
		assert(bad("12a"));
		assert(bad("18446744073709551616"));
	}

	assert(Util::Str::fmt("order %s at block %d", "o1", 7) == "order o1 at block 7");

	return 0;
}
