#ifndef S_BUS_HPP
#define S_BUS_HPP

#include"S/Detail/Signal.hpp"
#include<functional>
#include<memory>
#include<typeindex>
#include<typeinfo>
#include<unordered_map>

namespace S {

/** class S::Bus
 *
 * @brief signal bus for broadcasting messages and
 * subscribing to broadcasts.
 *
 * @desc messages are identified by their C++ type.
 * All modules of the service communicate only by
 * raising and subscribing to messages on one bus,
 * and only from the main loop.
 */
class Bus {
private:
	std::unordered_map< std::type_index
			  , std::unique_ptr<Detail::SignalBase>
			  > signals;

	/* Created on first use by either side.  */
	template<typename a>
	Detail::Signal<a>& signal() {
		auto& slot = signals[std::type_index(typeid(a))];
		if (!slot)
			slot = std::make_unique<Detail::Signal<a>>();
		return static_cast<Detail::Signal<a>&>(*slot);
	}

public:
	Bus() =default;
	Bus(Bus&&) =default;
	Bus(Bus const&) =delete;

	template<typename a>
	void subscribe(std::function<Ev::Io<void>(a const&)> cb) {
		signal<a>().subscribe(std::move(cb));
	}
	template<typename a>
	Ev::Io<void> raise(a value) {
		return signal<a>().raise(std::move(value));
	}
};

}

#endif /* !defined(S_BUS_HPP) */
