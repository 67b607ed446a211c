#include"Ev/Detail/idle.hpp"
#include<ev.h>
#include<exception>
#include<iostream>
#include<memory>

namespace {

struct IdleTask {
	ev_idle watcher;
	std::function<void()> f;
};

void idle_task_handler(EV_P_ ev_idle* w, int) {
	auto task = std::unique_ptr<IdleTask>((IdleTask*) w->data);
	ev_idle_stop(EV_A_ &task->watcher);

	auto f = std::move(task->f);
	task = nullptr;

	f();
}

}

namespace Ev { namespace Detail {

void on_idle(std::function<void()> f) {
	auto task = std::make_unique<IdleTask>();
	task->f = std::move(f);
	ev_idle_init(&task->watcher, &idle_task_handler);
	task->watcher.data = task.get();
	/* Owned by the loop until the handler fires.  */
	ev_idle_start(EV_DEFAULT_ &task.release()->watcher);
}

void report_unhandled(char const* where, std::exception_ptr e) {
	std::cerr << "Unhandled exception in " << where << ": ";
	try {
		std::rethrow_exception(e);
	} catch (std::exception const& ex) {
		std::cerr << ex.what() << std::endl;
		return;
	} catch (...) {
	}
	std::cerr << "(not a std::exception)" << std::endl;
}

}}
