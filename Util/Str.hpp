#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#include<stdarg.h>
#include<string>

namespace Util { namespace Str {

/* Copy of s without leading or trailing whitespace.  */
std::string trim(std::string const& s);

/* Whether s is an optional '-' followed by one or more
 * ASCII digits.  Says nothing about range.  */
bool isdecimal(std::string const& s);

/* printf-style formatting into a std::string.  */
std::string fmt(char const* tpl, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 1, 2)))
#endif
;
std::string vfmt(char const* tpl, va_list ap);

}}

#endif /* !defined(UTIL_STR_HPP) */
