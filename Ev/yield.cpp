#include"Ev/Detail/on_idle.hpp"
#include"Ev/Io.hpp"
#include"Ev/yield.hpp"

namespace Ev {

Io<void> yield() {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)> _
			  ) {
		Ev::Detail::on_idle(std::move(pass));
	});
}

Io<void> yield(std::size_t n) {
	auto act = Ev::lift();
	for (auto i = std::size_t(0); i < n; ++i)
		act += yield();
	return act;
}

}
