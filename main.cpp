#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Pfs/Main.hpp"
#include<iostream>
#include<memory>
#include<string>
#include<vector>

int main(int argc, char** argv) {
	auto service = std::make_shared<Pfs::Main>(
		std::vector<std::string>(argv, argv + argc),
		std::cin, std::cout, std::cerr
	);
	/* The continuation holds service until the loop is done
	 * with it.  */
	return Ev::start(service->run().then([service](int code) {
		return Ev::lift(code);
	}));
}
