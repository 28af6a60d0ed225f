#ifndef JSON_DETAIL_ESCAPE_HPP
#define JSON_DETAIL_ESCAPE_HPP

#include<string>

namespace Json { namespace Detail {

/* Escapes the string for use between JSON double quotes.  */
std::string escape(std::string const&);

/* Formats a double in the C locale.  */
std::string from_double(double);

}}

#endif /* !defined(JSON_DETAIL_ESCAPE_HPP) */
