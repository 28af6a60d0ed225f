#include"Ev/Detail/on_idle.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<exception>
#include<iostream>
#include<memory>

namespace {

struct Idle {
	ev_idle watcher;
	std::function<void()> f;
};

void idle_handler(EV_P_ ev_idle* raw, int) {
	/* Back from C: the watcher is embedded in the Idle.  */
	auto idle = std::unique_ptr<Idle>((Idle*) raw->data);
	ev_idle_stop(EV_A_ &idle->watcher);

	auto f = std::move(idle->f);
	idle = nullptr;

	f();
}

}

namespace Ev { namespace Detail {

void on_idle(std::function<void()> f) {
	auto idle = Util::make_unique<Idle>();
	idle->f = std::move(f);
	ev_idle_init(&idle->watcher, &idle_handler);
	idle->watcher.data = idle.get();
	/* Owned by the loop until the handler runs.  */
	auto raw = idle.release();
	ev_idle_start(EV_DEFAULT_ &raw->watcher);
}

void report_unhandled(char const* where, std::exception_ptr e) {
	std::cerr << "Unhandled exception in " << where << ": ";
	try {
		std::rethrow_exception(e);
	} catch (std::exception const& ex) {
		std::cerr << ex.what() << std::endl;
	} catch (...) {
		std::cerr << "(not a std::exception)" << std::endl;
	}
}

}}
