#include"Sha256/Hash.hpp"
#include"Util/Str.hpp"
#include<sodium.h>
#include<stdexcept>

namespace Sha256 {

bool Hash::valid_string(std::string const& s) {
	return s.size() == 2 * 32 && Util::Str::ishex(s);
}

Hash::Hash(std::string const& s) {
	if (!valid_string(s))
		throw std::invalid_argument(
			"Sha256::Hash: expected 64 hex digits, got \"" + s + "\""
		);
	auto bytes = Util::Str::hexread(s);
	from_buffer(bytes.data());
}

Hash::operator std::string() const {
	return Util::Str::hexdump(d.data(), d.size());
}

Hash::operator bool() const {
	return sodium_is_zero(d.data(), d.size()) == 0;
}

bool Hash::operator==(Hash const& i) const {
	return sodium_memcmp(d.data(), i.d.data(), d.size()) == 0;
}

}
