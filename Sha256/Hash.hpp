#ifndef SHA256_HASH_HPP
#define SHA256_HASH_HPP

#include<array>
#include<cstdint>
#include<cstring>
#include<functional>
#include<iostream>
#include<string>

namespace Sha256 {

/** class Sha256::Hash
 *
 * @brief a 32-byte SHA-256 digest, held by value.
 *
 * @desc Secret hashes, escrow ids and transaction
 * hashes are all of this type.
 * A default-constructed hash is all zeroes and tests
 * false; no real digest is expected to be zero.
 */
class Hash {
private:
	std::array<std::uint8_t, 32> d;

	friend struct std::hash<Hash>;

public:
	Hash() { d.fill(0); }

	/* Expects exactly 64 hex digits.  */
	static
	bool valid_string(std::string const&);
	explicit
	Hash(std::string const&);

	explicit
	operator std::string() const;

	explicit
	operator bool() const;
	bool operator!() const { return !bool(*this); }

	/* Constant-time.  */
	bool operator==(Hash const&) const;
	bool operator!=(Hash const& i) const { return !(*this == i); }
	/* Byte order, for std::map keys.  */
	bool operator<(Hash const& i) const { return d < i.d; }

	void to_buffer(std::uint8_t out[32]) const {
		std::memcpy(out, d.data(), d.size());
	}
	void from_buffer(std::uint8_t const in[32]) {
		std::memcpy(d.data(), in, d.size());
	}
};

inline
std::ostream& operator<<(std::ostream& os, Hash const& i) {
	return os << std::string(i);
}

}

namespace std {
template<>
struct hash<::Sha256::Hash> {
	std::size_t operator()(::Sha256::Hash const& i) const {
		/* The leading bytes are already uniform.  */
		auto ret = std::size_t();
		std::memcpy(&ret, i.d.data(), sizeof(ret));
		return ret;
	}
};
}

#endif /* !defined(SHA256_HASH_HPP) */
