#include"Jsmn/Detail/Document.hpp"
#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"

namespace Jsmn {

char Object::first_char() const {
	return doc->text[doc->tokens[i].start];
}

bool Object::is_null() const {
	if (!doc)
		return true;
	return doc->tokens[i].type == Detail::Primitive
	    && first_char() == 'n'
	     ;
}
bool Object::is_boolean() const {
	if (!doc || doc->tokens[i].type != Detail::Primitive)
		return false;
	auto c = first_char();
	return c == 't' || c == 'f';
}
bool Object::is_string() const {
	return doc && doc->tokens[i].type == Detail::String;
}
bool Object::is_object() const {
	return doc && doc->tokens[i].type == Detail::Object;
}
bool Object::is_array() const {
	return doc && doc->tokens[i].type == Detail::Array;
}
bool Object::is_number() const {
	if (!doc || doc->tokens[i].type != Detail::Primitive)
		return false;
	auto c = first_char();
	return c != 't' && c != 'f' && c != 'n';
}

Object::operator bool() const {
	if (is_null())
		return false;
	if (!is_boolean())
		throw TypeError();
	return first_char() == 't';
}
Object::operator std::string() const {
	if (!is_string())
		throw TypeError();
	return Detail::Str::from_escaped(doc->text_of(i));
}

std::size_t Object::size() const {
	if (!is_object() && !is_array())
		throw TypeError();
	return std::size_t(doc->tokens[i].size);
}

std::vector<std::string> Object::keys() const {
	if (!is_object())
		throw TypeError();
	return doc->keys(i);
}
bool Object::has(std::string const& key) const {
	if (!is_object())
		throw TypeError();
	return bool(doc->member(i, key));
}
Object Object::operator[](std::string const& key) const {
	if (!is_object())
		throw TypeError();
	auto m = doc->member(i, key);
	if (!m)
		return Object();
	return Object(doc, *m);
}
Object Object::operator[](std::size_t n) const {
	if (!is_array())
		throw TypeError();
	auto e = doc->element(i, n);
	if (!e)
		return Object();
	return Object(doc, *e);
}

std::string Object::direct_text() const {
	if (!doc)
		return "null";
	return doc->text_of(i);
}

std::ostream& operator<<(std::ostream& os, Jsmn::Object const& o) {
	/* Strings keep their escapes in the input text, so
	 * only the quotes need restoring.  */
	if (o.is_string())
		return os << '"' << o.direct_text() << '"';
	return os << o.direct_text();
}

}
