#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Xswap/Mod/Waiter.hpp"
#include"Xswap/Shutdown.hpp"
#include<assert.h>

namespace {

/* Never completes.  */
Ev::Io<int> forever() {
	return Ev::Io<int>([]( std::function<void(int)> pass
			     , std::function<void(std::exception_ptr)> fail
			     ) {
	});
}

}

int main() {
	auto bus = S::Bus();
	Xswap::Mod::Waiter waiter(bus);

	auto waited = false;
	auto interrupted = false;

	auto code = Ev::lift().then([&]() {
		return waiter.wait(0.01);
	}).then([&]() {
		waited = true;
		return waiter.timed(1.0, Ev::lift(42));
	}).then([&](int v) {
		assert(waited);
		assert(v == 42);
		return waiter.timed(0.01, forever()).then([](int) {
			assert(false);
			return Ev::lift(false);
		}).catching<Xswap::Mod::Waiter::TimedOut>([](Xswap::Mod::Waiter::TimedOut const&) {
			return Ev::lift(true);
		});
	}).then([&](bool timed_out) {
		assert(timed_out);

		/* A shutdown interrupts pending waits.  */
		return Ev::concurrent(waiter.wait(1000).then([]() {
			assert(false);
			return Ev::lift();
		}).catching<Xswap::Shutdown>([&](Xswap::Shutdown const&) {
			interrupted = true;
			return Ev::lift();
		}));
	}).then([&]() {
		return Ev::yield(5);
	}).then([&]() {
		assert(!interrupted);
		assert(waiter.pending() >= 1);
		return bus.raise(Xswap::Shutdown());
	}).then([&]() {
		return Ev::yield(5);
	}).then([&]() {
		assert(interrupted);
		assert(waiter.pending() == 0);

		/* And later ones fail at once.  */
		return waiter.wait(1000).then([]() {
			return Ev::lift(false);
		}).catching<Xswap::Shutdown>([](Xswap::Shutdown const&) {
			return Ev::lift(true);
		});
	}).then([](bool refused) {
		assert(refused);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
