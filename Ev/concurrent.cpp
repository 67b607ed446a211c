#include"Ev/Detail/idle.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"

namespace Ev {

Io<void> concurrent(Io<void> io) {
	return Io<void>([io]( std::function<void()> pass
			    , std::function<void(std::exception_ptr)> fail
			    ) {
		try {
			Detail::on_idle([io]() {
				io.run([]() { }, [](std::exception_ptr e) {
					Detail::report_unhandled(
						"concurrent task", e
					);
				});
			});
		} catch (...) {
			fail(std::current_exception());
			return;
		}
		pass();
	});
}

}
