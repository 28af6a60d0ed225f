#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/signal.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<signal.h>

int main() {
	auto got = 0;
	auto raised = false;

	auto code = Ev::lift().then([&]() {
		return Ev::concurrent(Ev::yield(5).then([&]() {
			raised = true;
			::raise(SIGUSR2);
			return Ev::lift();
		}));
	}).then([&]() {
		return Ev::signal({SIGUSR1, SIGUSR2});
	}).then([&](int signum) {
		assert(raised);
		got = signum;
		return Ev::lift(0);
	});

	auto rv = Ev::start(code);
	assert(got == SIGUSR2);
	return rv;
}
