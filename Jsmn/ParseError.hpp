#ifndef JSMN_PARSEERROR_HPP
#define JSMN_PARSEERROR_HPP

#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<stdexcept>
#include<string>

namespace Jsmn {

/** class Jsmn::ParseError
 *
 * @brief thrown when a line is not exactly one
 * well-formed JSON datum.
 *
 * @desc `offset()` is the character offset into the
 * line where parsing gave up; it equals the line length
 * if the input ended early.
 */
class ParseError : public Util::BacktraceException<std::runtime_error> {
private:
	std::size_t off;

public:
	ParseError(char const* reason, std::size_t offset)
		: Util::BacktraceException<std::runtime_error>(
			std::string("Parse error at offset ")
			+ std::to_string(offset) + ": " + reason
		  )
		, off(offset) { }

	std::size_t offset() const { return off; }
};

}

#endif /* !defined(JSMN_PARSEERROR_HPP) */
