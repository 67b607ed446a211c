#include"Jsmn/Detail/Document.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include<cctype>
#include<memory>
#include<vector>

/* jsmn has all its code in the jsmn.h header, so instantiate all its
 * code into this compilation unit.
 */
#define JSMN_STATIC 1		/* Everything in this compilation unit.  */
#undef JSMN_HEADER		/* Not header-only.  */
#define JSMN_PARENT_LINKS 1	/* Faster parsing for more memory use.  */
#define JSMN_STRICT 1		/* Reject sloppy JSON.  */
# include <jsmn.h>

namespace {

Jsmn::Detail::Type type_convert(jsmntype_t t) {
	switch (t) {
	case JSMN_OBJECT: return Jsmn::Detail::Object;
	case JSMN_ARRAY: return Jsmn::Detail::Array;
	case JSMN_STRING: return Jsmn::Detail::String;
	case JSMN_PRIMITIVE: return Jsmn::Detail::Primitive;
	default: return Jsmn::Detail::Undefined;
	}
}
Jsmn::Detail::Token token_convert(jsmntok_t const& tok) {
	auto ret = Jsmn::Detail::Token();
	ret.type = type_convert(tok.type);
	ret.start = tok.start;
	ret.end = tok.end;
	ret.size = tok.size;
	return ret;
}

}

namespace Jsmn {

Jsmn::Object Parser::parse(std::string const& line) {
	/* In strict mode jsmn needs a delimiter after a
	 * top-level primitive.  */
	auto text = line + "\n";
	auto toks = std::vector<jsmntok_t>(16);
	auto base = jsmn_parser();
	auto res = int(0);
	for (;;) {
		jsmn_init(&base);
		res = jsmn_parse( &base
				, text.data(), text.size()
				, &toks[0], toks.size()
				);
		if (res != JSMN_ERROR_NOMEM)
			break;
		toks.resize(toks.size() * 2);
	}
	switch (res) {
	case JSMN_ERROR_INVAL:
		throw ParseError("invalid character", base.pos);
	case JSMN_ERROR_PART:
		throw ParseError("unexpected end of input", line.size());
	case 0:
		throw ParseError("no value", line.size());
	default:
		break;
	}

	auto doc = std::make_shared<Detail::Document>();
	doc->text = std::move(text);
	doc->tokens.reserve(res);
	for (auto i = 0; i < res; ++i)
		doc->tokens.push_back(token_convert(toks[i]));

	/* Only one top-level datum is accepted.  */
	auto after = doc->after(0);
	if (after != std::size_t(res))
		throw ParseError( "more than one value"
				, std::size_t(doc->tokens[after].start)
				);
	/* A top-level primitive ends at the first delimiter, so
	 * check that only whitespace follows the datum.  A
	 * string token ends before its closing quote.  */
	auto const& top = doc->tokens[0];
	auto tail = std::size_t(top.end);
	if (top.type == Detail::String)
		++tail;
	for (auto i = tail; i < doc->text.size(); ++i) {
		if (!std::isspace((unsigned char) doc->text[i]))
			throw ParseError("trailing text", i);
	}

	return Object(std::move(doc), 0);
}

}
