#include"Tn/Reachability.hpp"
#include<stdexcept>

namespace Tn {

Reachability reachability_from_string(std::string const& s) {
	if (s == "reachable")
		return Reachability::Reachable;
	if (s == "unreachable")
		return Reachability::Unreachable;
	if (s == "unknown")
		return Reachability::Unknown;
	throw std::invalid_argument(
		std::string("Unknown reachability status: ") + s
	);
}

char const* to_string(Reachability r) {
	switch (r) {
	case Reachability::Reachable: return "reachable";
	case Reachability::Unreachable: return "unreachable";
	case Reachability::Unknown: return "unknown";
	}
	return "unknown";
}

}
