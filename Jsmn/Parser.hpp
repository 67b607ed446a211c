#ifndef JSMN_PARSER_HPP
#define JSMN_PARSER_HPP

#include<string>

namespace Jsmn { class Object; }

namespace Jsmn {

/** Jsmn::Parser::parse
 *
 * @brief turns one input line into a navigable
 * Jsmn::Object.
 *
 * @desc the line must hold exactly one JSON datum,
 * optionally surrounded by whitespace; anything else
 * throws Jsmn::ParseError.
 */
class Parser {
public:
	Parser() =delete;

	static Object parse(std::string const& line);
};

}

#endif /* !defined(JSMN_PARSER_HPP) */
