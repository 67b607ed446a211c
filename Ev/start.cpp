#include"Ev/Detail/idle.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include<ev.h>
#include<iostream>

namespace Ev {

int start(Io<int> main) {
	if (!ev_default_loop(0)) {
		std::cerr << "libev failed to initialize" << std::endl;
		return 255;
	}

	auto exit_code = 255;
	Detail::on_idle([&exit_code, main]() {
		main.run([&exit_code](int code) {
			exit_code = code;
		}, [&exit_code](std::exception_ptr e) {
			Detail::report_unhandled("main", e);
			exit_code = 254;
		});
	});

	if (ev_run(EV_DEFAULT_ 0))
		std::cerr << "WARNING: libev watchers still active."
			  << std::endl;

	return exit_code;
}

}
