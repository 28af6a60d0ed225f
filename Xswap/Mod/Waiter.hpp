#ifndef XSWAP_MOD_WAITER_HPP
#define XSWAP_MOD_WAITER_HPP

#include"Ev/Io.hpp"
#include<memory>

namespace S { class Bus; }

namespace Xswap { namespace Mod {

/** class Xswap::Mod::Waiter
 *
 * @brief owns every sleep in the service, so that
 * a `Xswap::Shutdown` on the bus can wake them all
 * with a `Xswap::Shutdown` exception.
 */
class Waiter {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	explicit
	Waiter(S::Bus& bus);
	~Waiter();

	/* Sleeps for the given number of seconds.  */
	Ev::Io<void> wait(double seconds);

	/** Xswap::Mod::Waiter::timed
	 *
	 * @brief runs the action, failing with
	 * `TimedOut` if it has not finished within
	 * `timeout` seconds.
	 *
	 * @desc A timed-out action keeps running in
	 * the background and whatever it later yields
	 * is dropped.
	 */
	template<typename a>
	Ev::Io<a> timed(double timeout, Ev::Io<a> action);
	struct TimedOut { };

	/* Number of sleeps currently pending.  */
	std::size_t pending() const;

private:
	Ev::Io<void> race(double timeout, Ev::Io<void> action);
};

template<typename a>
inline
Ev::Io<a> Waiter::timed(double timeout, Ev::Io<a> action) {
	auto slot = std::make_shared<std::shared_ptr<a>>();
	auto run = action.then([slot](a value) {
		*slot = std::make_shared<a>(std::move(value));
		return Ev::lift();
	});
	return race(timeout, std::move(run)).then([slot]() {
		return Ev::lift(std::move(**slot));
	});
}
template<>
inline
Ev::Io<void> Waiter::timed<void>(double timeout, Ev::Io<void> action) {
	return race(timeout, std::move(action));
}

}}

#endif /* !defined(XSWAP_MOD_WAITER_HPP) */
