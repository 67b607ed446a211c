#ifndef JSMN_DETAIL_DOCUMENT_HPP
#define JSMN_DETAIL_DOCUMENT_HPP

#include"Jsmn/Detail/Type.hpp"
#include<cstddef>
#include<optional>
#include<string>
#include<vector>

namespace Jsmn { namespace Detail {

struct Token {
	Type type;
	int start;
	int end;
	/* Number of direct children: keys for objects,
	 * elements for arrays, 1 for a key string.  */
	int size;
};

/** struct Jsmn::Detail::Document
 *
 * @brief one parsed line: the text and its tokens in
 * document order.
 *
 * @desc tokens refer to the text by offset; for strings
 * the range excludes the quotes.
 * Every lookup is a linear walk over the direct
 * children, which suits the small messages we read.
 */
struct Document {
	std::string text;
	std::vector<Token> tokens;

	/* Index of the first token after token i and all its
	 * descendants.  */
	std::size_t after(std::size_t i) const;

	std::string text_of(std::size_t i) const {
		auto const& t = tokens[i];
		return text.substr(t.start, t.end - t.start);
	}

	/* Token of the value under the given key of object
	 * i, or nothing.  */
	std::optional<std::size_t>
	member(std::size_t i, std::string const& key) const;
	/* Token of element n of array i, or nothing.  */
	std::optional<std::size_t>
	element(std::size_t i, std::size_t n) const;
	/* Unescaped keys of object i, in document order.  */
	std::vector<std::string> keys(std::size_t i) const;
};

}}

#endif /* !defined(JSMN_DETAIL_DOCUMENT_HPP) */
