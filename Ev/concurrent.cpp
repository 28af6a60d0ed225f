#include"Ev/Detail/on_idle.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include<memory>

namespace Ev {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::Io<void>([io]( std::function<void()> pass
				, std::function<void(std::exception_ptr)> _
				) {
		auto task = std::make_shared<Ev::Io<void>>(io);
		Ev::Detail::on_idle([task]() {
			task->run([]() { }, [](std::exception_ptr e) {
				Ev::Detail::report_unhandled("concurrent task", e);
			});
		});
		pass();
	});
}

}
