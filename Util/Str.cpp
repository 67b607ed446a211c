#include"Util/Str.hpp"
#include<stdio.h>
#include<vector>

namespace {

auto const whitespace = " \t\n\v\f\r";

}

namespace Util { namespace Str {

std::string trim(std::string const& s) {
	auto first = s.find_first_not_of(whitespace);
	if (first == std::string::npos)
		return "";
	auto last = s.find_last_not_of(whitespace);
	return s.substr(first, last - first + 1);
}

bool isdecimal(std::string const& s) {
	auto i = std::size_t(0);
	if (i < s.size() && s[i] == '-')
		++i;
	if (i == s.size())
		return false;
	for (; i < s.size(); ++i)
		if (s[i] < '0' || s[i] > '9')
			return false;
	return true;
}

std::string vfmt(char const* tpl, va_list ap) {
	va_list measure;
	va_copy(measure, ap);
	auto len = vsnprintf(nullptr, 0, tpl, measure);
	va_end(measure);
	if (len <= 0)
		return "";

	auto buf = std::vector<char>(std::size_t(len) + 1);
	va_list print;
	va_copy(print, ap);
	vsnprintf(buf.data(), buf.size(), tpl, print);
	va_end(print);
	return std::string(buf.data(), std::size_t(len));
}

std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto ret = vfmt(tpl, ap);
	va_end(ap);
	return ret;
}

}}
