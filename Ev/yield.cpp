#include"Ev/Detail/idle.hpp"
#include"Ev/Io.hpp"
#include"Ev/yield.hpp"

namespace Ev {

Io<void> yield(std::size_t num_yields) {
	auto act = lift();
	for (auto i = std::size_t(0); i < num_yields; ++i)
		act = act.then([]() {
			return Io<void>([]( std::function<void()> pass
					  , std::function<void(std::exception_ptr)>
					  ) {
				Detail::on_idle(std::move(pass));
			});
		});
	return act;
}

}
