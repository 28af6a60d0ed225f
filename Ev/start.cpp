#include"Ev/Detail/on_idle.hpp"
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

	/* Stays 255 if main never finishes.  */
	auto exit_code = 255;
	Ev::Detail::on_idle([&main, &exit_code]() {
		auto io = std::move(main);
		io.run([&exit_code](int c) {
			exit_code = c;
		}, [&exit_code](std::exception_ptr e) {
			Ev::Detail::report_unhandled("main", e);
			exit_code = 254;
		});
	});

	if (ev_run(EV_DEFAULT_ 0))
		std::cerr << "WARNING: libev watchers still active."
			  << std::endl;

	return exit_code;
}

}
