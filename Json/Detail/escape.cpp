#include"Json/Detail/escape.hpp"
#include<iomanip>
#include<locale>
#include<sstream>

namespace {

/* Length of the well-formed UTF-8 sequence starting at
 * `i`, or 0 if the byte there does not start one.  */
std::size_t utf8_length(std::string const& s, std::size_t i) {
	auto at = [&s](std::size_t j) { return (unsigned char) s[j]; };
	auto lead = at(i);
	auto n = std::size_t(0);
	auto lo = (unsigned char) 0x80;
	auto hi = (unsigned char) 0xBF;
	if (lead >= 0xC2 && lead <= 0xDF)
		n = 2;
	else if (lead >= 0xE0 && lead <= 0xEF) {
		n = 3;
		if (lead == 0xE0)
			lo = 0xA0;
		else if (lead == 0xED)
			hi = 0x9F;
	} else if (lead >= 0xF0 && lead <= 0xF4) {
		n = 4;
		if (lead == 0xF0)
			lo = 0x90;
		else if (lead == 0xF4)
			hi = 0x8F;
	} else
		return 0;

	if (i + n > s.size())
		return 0;
	if (at(i + 1) < lo || at(i + 1) > hi)
		return 0;
	for (auto k = std::size_t(2); k < n; ++k)
		if (at(i + k) < 0x80 || at(i + k) > 0xBF)
			return 0;
	return n;
}

void escape_byte(std::ostream& os, unsigned char c) {
	os << "\\u00"
	   << std::hex << std::setfill('0') << std::setw(2)
	   << (unsigned int) c
	   << std::dec
	   ;
}

}

namespace Json { namespace Detail {

std::string escape(std::string const& s) {
	auto os = std::ostringstream();
	auto i = std::size_t(0);
	while (i < s.size()) {
		auto c = s[i];
		switch (c) {
		case '\"': os << "\\\""; break;
		case '\\': os << "\\\\"; break;
		case '\b': os << "\\b"; break;
		case '\f': os << "\\f"; break;
		case '\n': os << "\\n"; break;
		case '\r': os << "\\r"; break;
		case '\t': os << "\\t"; break;
		default:
			if ((unsigned char) c < 0x20)
				escape_byte(os, (unsigned char) c);
			else if ((unsigned char) c < 0x80)
				os << c;
			else {
				/* Stray bytes, as in a binary secret,
				 * become the code point of the same
				 * value.  */
				auto n = utf8_length(s, i);
				if (n == 0)
					escape_byte(os, (unsigned char) c);
				else {
					os << s.substr(i, n);
					i += n;
					continue;
				}
			}
			break;
		}
		++i;
	}
	return os.str();
}

std::string from_double(double d) {
	/* Assumes C locale is JSON-compatible.  */
	auto os = std::ostringstream();
	os.imbue(std::locale("C"));
	os << d;
	return os.str();
}

}}
