#ifndef JSMN_DETAIL_STR_HPP
#define JSMN_DETAIL_STR_HPP

#include<cstdint>
#include<string>

namespace Jsmn { namespace Detail { namespace Str {

/* Text of a JSON string literal, without the quotes,
 * for the given contents.  */
std::string to_escaped(std::string const& raw);
/* Contents of a JSON string literal given its text
 * without the quotes.  */
std::string from_escaped(std::string const& escaped);

/* Value of a JSON number token.  Only exact integers in
 * the int64 range are accepted: anything with a fraction
 * or exponent, or out of range, throws
 * std::invalid_argument.  */
std::int64_t to_int64(std::string const& number);

}}}

#endif /* !defined(JSMN_DETAIL_STR_HPP) */
