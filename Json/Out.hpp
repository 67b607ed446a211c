#ifndef JSON_OUT_HPP
#define JSON_OUT_HPP

#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include<cstddef>
#include<cstdint>
#include<memory>
#include<optional>
#include<sstream>
#include<string>
#include<type_traits>

namespace Json { class Out; }

namespace Json { namespace Detail {

typedef std::ostringstream Content;

/* Writers for the leaf values a builder accepts.  */
template<typename t>
typename std::enable_if<std::is_integral<t>::value>::type
write(Content& os, t v) {
	if constexpr (std::is_same<t, bool>::value)
		os << (v ? "true" : "false");
	else if constexpr (std::is_signed<t>::value)
		os << std::int64_t(v);
	else
		os << std::uint64_t(v);
}
inline
void write(Content& os, std::string const& v) {
	os << '"' << Jsmn::Detail::Str::to_escaped(v) << '"';
}
inline
void write(Content& os, char const* v) {
	write(os, std::string(v));
}
inline
void write(Content& os, std::nullptr_t) {
	os << "null";
}
template<typename t>
void write(Content& os, std::optional<t> const& v) {
	if (v)
		write(os, *v);
	else
		os << "null";
}
/* Already-parsed input, e.g. a request id to echo.  */
inline
void write(Content& os, Jsmn::Object const& v) {
	os << v;
}
inline
void write(Content& os, Json::Out const& v);

/* Common part of object and array builders: brackets and
 * the commas between members.  */
template<typename Up>
class Scope {
protected:
	Up& up;
	Content& content;
	bool started;

	Scope(Up& up_, Content& content_, char open)
		: up(up_), content(content_), started(false) {
		content << open;
	}

	void next() {
		if (started)
			content << ',';
		started = true;
	}
	void key(std::string const& name) {
		next();
		write(content, name);
		content << ':';
	}
	Up& close(char c) {
		content << c;
		return up;
	}
};

template<typename Up> class Array;

template<typename Up>
class Object : private Scope<Up> {
private:
	using Scope<Up>::key;
	using Scope<Up>::content;

public:
	Object(Up& up_, Content& content_) : Scope<Up>(up_, content_, '{') { }

	template<typename a>
	Object<Up>& field(std::string const& name, a const& value) {
		key(name);
		write(content, value);
		return *this;
	}
	Array<Object<Up>> start_array(std::string const& name) {
		key(name);
		return Array<Object<Up>>(*this, content);
	}
	Object<Object<Up>> start_object(std::string const& name) {
		key(name);
		return Object<Object<Up>>(*this, content);
	}
	Up& end_object() {
		return this->close('}');
	}
};

template<typename Up>
class Array : private Scope<Up> {
private:
	using Scope<Up>::next;
	using Scope<Up>::content;

public:
	Array(Up& up_, Content& content_) : Scope<Up>(up_, content_, '[') { }

	template<typename a>
	Array<Up>& entry(a const& value) {
		next();
		write(content, value);
		return *this;
	}
	Array<Array<Up>> start_array() {
		next();
		return Array<Array<Up>>(*this, content);
	}
	Object<Array<Up>> start_object() {
		next();
		return Object<Array<Up>>(*this, content);
	}
	Up& end_array() {
		return this->close(']');
	}
};

}

/** class Json::Out
 *
 * @brief builds one JSON datum, printed without any
 * newlines so it can be written as a single line.
 *
 * @desc build by chaining from start_object or
 * start_array; each end_ call returns the enclosing
 * builder.
 * Copies share the same text.
 */
class Out {
private:
	std::shared_ptr<Json::Detail::Content> content;

public:
	Out() : content(std::make_shared<Json::Detail::Content>()) { }
	explicit
	Out(Jsmn::Object const& js) : Out() {
		*content << js;
	}

	std::string output() const {
		return content->str();
	}

	Json::Detail::Object<Json::Out> start_object() {
		return Json::Detail::Object<Json::Out>(*this, *content);
	}
	Json::Detail::Array<Json::Out> start_array() {
		return Json::Detail::Array<Json::Out>(*this, *content);
	}

	static
	Json::Out empty_object() {
		auto ret = Json::Out();
		ret.start_object().end_object();
		return ret;
	}
};

namespace Detail {

inline
void write(Content& os, Json::Out const& v) {
	os << v.output();
}

}

}

#endif /* !defined(JSON_OUT_HPP) */
