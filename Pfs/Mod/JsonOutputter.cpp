#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/yield.hpp"
#include"Pfs/Mod/JsonOutputter.hpp"
#include"Pfs/Msg/JsonCout.hpp"
#include"S/Bus.hpp"

namespace Pfs { namespace Mod {

JsonOutputter::JsonOutputter( std::ostream& cout_
			    , S::Bus& bus
			    ) : cout(cout_) {
	bus.subscribe<Msg::JsonCout>([this](Msg::JsonCout const& j) {
		auto start = outs.empty();
		outs.push(j.obj.output());
		if (!start)
			return Ev::lift();
		return Ev::concurrent(loop());
	});
}

Ev::Io<void> JsonOutputter::loop() {
	return Ev::yield().then([this]() {
		if (outs.empty())
			return Ev::lift();
		cout << outs.front() << std::endl;
		outs.pop();
		return loop();
	});
}

}}
