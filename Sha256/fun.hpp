#ifndef SHA256_FUN_HPP
#define SHA256_FUN_HPP

#include"Sha256/Hash.hpp"
#include<cstddef>
#include<string>

namespace Sha256 {

/** Sha256::fun
 *
 * @brief computes the SHA-256 digest of the given
 * bytes.
 */
Sha256::Hash fun(void const* p, std::size_t len);

inline
Sha256::Hash fun(std::string const& s) {
	return fun(s.data(), s.size());
}

}

#endif /* !defined(SHA256_FUN_HPP) */
