#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

#include<cstdint>
#include<stdarg.h>
#include<stdexcept>
#include<string>
#include<vector>

namespace Util { namespace Str {

/* Hex encoding, lowercase, two digits per byte.  */
std::string hexbyte(std::uint8_t);
std::string hexdump(void const* p, std::size_t s);

/** Util::Str::hexread
 *
 * @brief decodes a hex string, as typed in a
 * secret or hashlock on the command line.
 * Either case is accepted.
 *
 * @desc Throws `HexParseFailure` on odd length or a
 * non-hex digit.
 */
struct HexParseFailure : public std::runtime_error {
	explicit
	HexParseFailure(std::string const& why)
		: std::runtime_error("hexread: " + why) { }
};
std::vector<std::uint8_t> hexread(std::string const&);
/* Whether `hexread` would accept it.  */
bool ishex(std::string const&);

std::string trim(std::string const& s);
/* "a,,b" gives three fields; "" gives none.  */
std::vector<std::string> split(std::string const& s, char sep);
/* Decimal digits only; throws std::invalid_argument
 * otherwise, or on overflow.  */
std::uint64_t to_u64(std::string const& s);

/* printf-style formatting into a std::string.  */
std::string fmt(char const *tpl, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 1, 2)))
#endif
;
std::string vfmt(char const *tpl, va_list ap);

}}

#endif /* !defined(UTIL_STR_HPP) */
