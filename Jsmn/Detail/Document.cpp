#include"Jsmn/Detail/Document.hpp"
#include"Jsmn/Detail/Str.hpp"

namespace Jsmn { namespace Detail {

std::size_t Document::after(std::size_t i) const {
	auto pending = std::size_t(1);
	while (pending > 0) {
		pending += tokens[i].size;
		--pending;
		++i;
	}
	return i;
}

std::optional<std::size_t>
Document::member(std::size_t i, std::string const& key) const {
	auto count = tokens[i].size;
	auto k = i + 1;
	for (auto n = 0; n < count; ++n) {
		if (Str::from_escaped(text_of(k)) == key)
			return k + 1;
		k = after(k + 1);
	}
	return std::nullopt;
}

std::optional<std::size_t>
Document::element(std::size_t i, std::size_t n) const {
	if (n >= std::size_t(tokens[i].size))
		return std::nullopt;
	auto e = i + 1;
	for (auto step = std::size_t(0); step < n; ++step)
		e = after(e);
	return e;
}

std::vector<std::string> Document::keys(std::size_t i) const {
	auto ret = std::vector<std::string>();
	auto count = tokens[i].size;
	auto k = i + 1;
	for (auto n = 0; n < count; ++n) {
		ret.push_back(Str::from_escaped(text_of(k)));
		k = after(k + 1);
	}
	return ret;
}

}}
