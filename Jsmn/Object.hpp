#ifndef JSMN_OBJECT_HPP
#define JSMN_OBJECT_HPP

#include"Util/BacktraceException.hpp"
#include<cstddef>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>
#include<vector>

namespace Jsmn { namespace Detail { struct Document; }}
namespace Jsmn { class Parser; }

namespace Jsmn {

/* Thrown when a datum is read as the wrong type.  */
class TypeError : public Util::BacktraceException<std::invalid_argument> {
public:
	TypeError() : Util::BacktraceException<std::invalid_argument>(
		"JSON datum has the wrong type"
	) { }
};

/** class Jsmn::Object
 *
 * @brief read-only view of one datum in a parsed line.
 *
 * @desc copies are cheap and share the parsed line.
 * A default-constructed Object is JSON `null`, and so is
 * the result of looking up a missing key or index.
 */
class Object {
private:
	std::shared_ptr<Detail::Document const> doc;
	std::size_t i;

	Object( std::shared_ptr<Detail::Document const> doc_
	      , std::size_t i_
	      ) : doc(std::move(doc_)), i(i_) { }

	char first_char() const;

	friend class Parser;

public:
	Object() : doc(nullptr), i(0) { }

	bool is_null() const;
	bool is_boolean() const;
	bool is_string() const;
	bool is_object() const;
	bool is_array() const;
	bool is_number() const;

	/* Conversions throw TypeError on the wrong type,
	 * except that null converts to false.
	 * Numbers are read through direct_text.  */
	explicit operator bool() const;
	explicit operator std::string() const;

	/* Keys of objects, elements of arrays.  */
	std::size_t size() const;

	std::vector<std::string> keys() const;
	bool has(std::string const&) const;
	Object operator[](std::string const&) const;
	Object operator[](std::size_t) const;

	/* The text of the datum as it appeared in the input,
	 * without the quotes of a string; for numbers this
	 * keeps every digit.  */
	std::string direct_text() const;
};

/* Prints on one line, as it appeared in the input.  */
std::ostream& operator<<(std::ostream&, Jsmn::Object const&);

}

#endif /* !defined(JSMN_OBJECT_HPP) */
