#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Xswap/Mod/Waiter.hpp"
#include"Xswap/Shutdown.hpp"
#include<cstdint>
#include<ev.h>
#include<map>

namespace {

typedef std::function<void()> PassF;
typedef std::function<void(std::exception_ptr)> FailF;

void fail_with_shutdown(FailF const& fail) {
	try {
		throw Xswap::Shutdown();
	} catch (...) {
		fail(std::current_exception());
	}
}

/* First of two outcomes wins, the other is ignored.  */
class Race {
private:
	PassF pass;
	FailF fail;
	bool settled;

public:
	Race(PassF pass_, FailF fail_)
		: pass(std::move(pass_))
		, fail(std::move(fail_))
		, settled(false)
		{ }

	void win() {
		if (settled)
			return;
		settled = true;
		auto f = std::move(pass);
		fail = nullptr;
		f();
	}
	void lose(std::exception_ptr e) {
		if (settled)
			return;
		settled = true;
		auto f = std::move(fail);
		pass = nullptr;
		f(e);
	}
};

}

namespace Xswap { namespace Mod {

class Waiter::Impl {
private:
	struct Sleep {
		ev_timer watcher;
		Impl* owner;
		std::uint64_t id;
		PassF pass;
		FailF fail;
	};

	std::map<std::uint64_t, std::unique_ptr<Sleep>> sleeps;
	std::uint64_t next_id;
	bool stopping;

	static
	void on_timer(EV_P_ ev_timer* raw, int) {
		auto sleep = (Sleep*) raw->data;
		ev_timer_stop(EV_A_ raw);

		auto pass = std::move(sleep->pass);
		/* Destroys the sleep.  */
		sleep->owner->sleeps.erase(sleep->id);

		pass();
	}

	void wake_all() {
		stopping = true;
		/* Woken greenthreads may start new sleeps,
		 * which must then see an empty map.  */
		auto woken = std::move(sleeps);
		sleeps.clear();
		for (auto& e : woken) {
			ev_timer_stop(EV_DEFAULT_ &e.second->watcher);
			fail_with_shutdown(e.second->fail);
		}
	}

public:
	explicit
	Impl(S::Bus& bus) : next_id(0), stopping(false) {
		bus.subscribe<Xswap::Shutdown>([this](Xswap::Shutdown const&) {
			wake_all();
			return Ev::lift();
		});
	}
	~Impl() {
		for (auto& e : sleeps)
			ev_timer_stop(EV_DEFAULT_ &e.second->watcher);
	}

	std::size_t pending() const { return sleeps.size(); }

	Ev::Io<void> wait(double seconds) {
		return Ev::Io<void>([this, seconds](PassF pass, FailF fail) {
			if (stopping)
				return fail_with_shutdown(fail);

			auto sleep = Util::make_unique<Sleep>();
			sleep->owner = this;
			sleep->id = next_id++;
			sleep->pass = std::move(pass);
			sleep->fail = std::move(fail);
			ev_timer_init(&sleep->watcher, &on_timer, seconds, 0);
			sleep->watcher.data = sleep.get();
			ev_timer_start(EV_DEFAULT_ &sleep->watcher);

			auto id = sleep->id;
			sleeps[id] = std::move(sleep);
		});
	}

	Ev::Io<void> race(double timeout, Ev::Io<void> action) {
		auto paction = std::make_shared<Ev::Io<void>>(std::move(action));
		return Ev::Io<void>([this, timeout, paction](PassF pass, FailF fail) {
			auto r = std::make_shared<Race>(std::move(pass), std::move(fail));
			auto lose = [r](std::exception_ptr e) { r->lose(e); };

			wait(timeout).run([r]() {
				try {
					throw TimedOut();
				} catch (...) {
					r->lose(std::current_exception());
				}
			}, lose);
			paction->run([r]() { r->win(); }, lose);
		}).then([]() {
			/* Resume the caller off the timer callback.  */
			return Ev::yield();
		});
	}
};

Waiter::Waiter(S::Bus& bus) : pimpl(Util::make_unique<Impl>(bus)) { }
Waiter::~Waiter() { }

Ev::Io<void> Waiter::wait(double seconds) {
	return pimpl->wait(seconds);
}
std::size_t Waiter::pending() const {
	return pimpl->pending();
}
Ev::Io<void> Waiter::race(double timeout, Ev::Io<void> action) {
	return pimpl->race(timeout, std::move(action));
}

}}
