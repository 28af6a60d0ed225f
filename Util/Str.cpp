#include<algorithm>
#include<cctype>
#include<cstdio>
#include<iomanip>
#include<sstream>
#include"Util/Str.hpp"

namespace Util {
namespace Str {

std::string hexbyte(std::uint8_t v) {
	std::ostringstream os;
	os << std::hex << std::setfill('0') << std::setw(2);
	/* uint8_t might be a char, which iostreams would print
	 * as a character.  */
	os << ((unsigned int) v);
	return os.str();
}

std::string hexdump(void const* vp, std::size_t s) {
	auto os = std::ostringstream();
	auto p = (std::uint8_t const*) vp;
	for (auto i = std::size_t(0); i < s; ++p, ++i)
		os << hexbyte(*p);
	return os.str();
}

namespace {

std::uint8_t parse_hex(char c) {
	if (('0' <= c) && (c <= '9'))
		return (std::uint8_t) (c - '0');
	if (('a' <= c) && (c <= 'f'))
		return (std::uint8_t) (c - 'a' + 10);
	if (('A' <= c) && (c <= 'F'))
		return (std::uint8_t) (c - 'A' + 10);
	throw HexParseFailure(std::string("Non-hex character: ") + c);
}

}

std::vector<std::uint8_t> hexread(std::string const& s) {
	if ((s.length() % 2) != 0)
		throw HexParseFailure("String length must be even.");

	auto buf = std::vector<std::uint8_t>(s.length() / 2);
	for (auto i = std::size_t(0); i < buf.size(); ++i)
		buf[i] = (parse_hex(s[i * 2]) << 4)
		       | parse_hex(s[i * 2 + 1])
		       ;
	return buf;
}

bool ishex(std::string const& s) {
	if ((s.size() % 2) != 0)
		return false;
	return std::all_of(s.begin(), s.end(), [](char c) {
		return std::isxdigit((unsigned char) c) != 0;
	});
}

std::string trim(std::string const& s) {
	auto start = std::find_if_not(s.begin(), s.end(), isspace);
	if (start == s.end())
		return "";

	auto rend = std::find_if_not(s.rbegin(), s.rend(), isspace);
	return std::string(start, rend.base());
}

std::vector<std::string> split(std::string const& s, char sep) {
	auto ret = std::vector<std::string>();
	if (s.empty())
		return ret;
	auto start = std::size_t(0);
	for (;;) {
		auto pos = s.find(sep, start);
		if (pos == std::string::npos) {
			ret.push_back(s.substr(start));
			break;
		}
		ret.push_back(s.substr(start, pos - start));
		start = pos + 1;
	}
	return ret;
}

std::uint64_t to_u64(std::string const& s) {
	if (s.empty() || !std::all_of(s.begin(), s.end(), [](char c) {
		return std::isdigit((unsigned char) c) != 0;
	}))
		throw std::invalid_argument(
			"Not an unsigned number: " + s
		);
	auto is = std::istringstream(s);
	auto ret = std::uint64_t();
	is >> ret;
	if (is.fail())
		throw std::invalid_argument(
			"Number out of range: " + s
		);
	return ret;
}

std::string fmt(char const *tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto ret = vfmt(tpl, ap);
	va_end(ap);
	return ret;
}

std::string vfmt(char const *tpl, va_list ap) {
	va_list ap2;
	va_copy(ap2, ap);
	auto size = std::vsnprintf(nullptr, 0, tpl, ap2);
	va_end(ap2);
	if (size < 0)
		return std::string(tpl);

	auto buf = std::vector<char>(std::size_t(size) + 1);
	std::vsnprintf(buf.data(), buf.size(), tpl, ap);
	return std::string(buf.data(), std::size_t(size));
}

}
}
