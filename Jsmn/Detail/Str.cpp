#include"Jsmn/Detail/Str.hpp"
#include"Util/Str.hpp"
#include<cerrno>
#include<cstdlib>
#include<iomanip>
#include<sstream>
#include<stdexcept>

namespace {

class StringReader {
private:
	std::string const& s;
	std::size_t i;
public:
	StringReader() =delete;
	explicit
	StringReader(std::string const& s_) : s(s_), i(0) { }

	bool eof() const { return i == s.length(); }
	char pop() {
		if (eof())
			throw std::invalid_argument("Truncated escape sequence.");
		return s[i++];
	}
	std::string pop_str(std::size_t l) {
		if (s.length() - i < l)
			throw std::invalid_argument("Truncated escape sequence.");
		auto ret = s.substr(i, l);
		i += l;
		return ret;
	}
};

std::uint32_t read_hex4(std::string const& uc) {
	auto cp = std::uint32_t(0);
	for (auto c : uc) {
		cp <<= 4;
		if ('0' <= c && c <= '9')
			cp += c - '0';
		else if ('a' <= c && c <= 'f')
			cp += c - 'a' + 10;
		else if ('A' <= c && c <= 'F')
			cp += c - 'A' + 10;
		else
			throw std::invalid_argument("Bad \\u escape.");
	}
	return cp;
}

}

namespace Jsmn { namespace Detail { namespace Str {

std::string to_escaped(std::string const& s) {
	std::ostringstream os;
	for (auto c : s) {
		switch (c) {
		case '\"': os << "\\\""; break;
		case '\\': os << "\\\\"; break;
		case '\b': os << "\\b"; break;
		case '\f': os << "\\f"; break;
		case '\n': os << "\\n"; break;
		case '\r': os << "\\r"; break;
		case '\t': os << "\\t"; break;
		default:
			if ((unsigned char) c < 32) {
				os << "\\u00"
				   << std::hex << std::setfill('0') << std::setw(2)
				   << ((unsigned int) (unsigned char) c)
				   << std::dec
				   ;
			} else {
				os << c;
			}
			break;
		}
	}
	return os.str();
}
std::string from_escaped(std::string const& s) {
	std::ostringstream os;
	for (auto sr = StringReader(s); !sr.eof(); ) {
		auto c = sr.pop();
		if (c != '\\') {
			os << c;
			continue;
		}
		c = sr.pop();
		switch (c) {
		case '\"': os << '\"'; break;
		case '\\': os << '\\'; break;
		case '/': os << '/'; break;
		case 'b': os << '\b'; break;
		case 'f': os << '\f'; break;
		case 'n': os << '\n'; break;
		case 'r': os << '\r'; break;
		case 't': os << '\t'; break;
		case 'u': {
			auto cp = read_hex4(sr.pop_str(4));
			/* Re-encode in UTF-8.  */
			if (cp < 0x80) {
				os << char(cp);
			} else if (cp < 0x800) {
				os << char(0xC0 | (cp >> 6))
				   << char(0x80 | (cp & 0x3F))
				   ;
			} else {
				os << char(0xE0 | (cp >> 12))
				   << char(0x80 | ((cp >> 6) & 0x3F))
				   << char(0x80 | (cp & 0x3F))
				   ;
			}
		} break;
		default:
			throw std::invalid_argument(
				Util::Str::fmt("Unknown escape \\%c.", c)
			);
		}
	}
	return os.str();
}

std::int64_t to_int64(std::string const& s) {
	if (!Util::Str::isdecimal(s))
		throw std::invalid_argument(
			Util::Str::fmt("Not an integer: %s", s.c_str())
		);
	errno = 0;
	auto end = (char*) nullptr;
	auto ret = std::strtoll(s.c_str(), &end, 10);
	if (errno == ERANGE || *end != '\0')
		throw std::invalid_argument(
			Util::Str::fmt("Integer out of range: %s", s.c_str())
		);
	return std::int64_t(ret);
}

}}}
