#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Xswap/Mod/Timers.hpp"
#include"Xswap/Mod/Waiter.hpp"
#include"Xswap/Msg/Init.hpp"
#include"Xswap/Msg/TimerAuctionRefresh.hpp"
#include"Xswap/Msg/TimerHealthCheck.hpp"
#include"Xswap/Msg/TimerRecoveryScan.hpp"
#include"Xswap/concurrent.hpp"
#include"Xswap/log.hpp"
#include<memory>
#include<string>

namespace {

template<typename T>
class PeriodicLoop : public std::enable_shared_from_this<PeriodicLoop<T>> {
private:
	std::string name;
	S::Bus& bus;
	Xswap::Mod::Waiter& waiter;
	double period;

	PeriodicLoop( std::string name_
		    , S::Bus& bus_
		    , Xswap::Mod::Waiter& waiter_
		    , double period_
		    ) : name(std::move(name_))
		      , bus(bus_)
		      , waiter(waiter_)
		      , period(period_)
		      { }

	Ev::Io<void> loop() {
		return Ev::lift().then([this]() {
			return waiter.wait(period);
		}).then([this]() {
			return Xswap::log( bus, Xswap::Trace
					 , "Timers: triggering %s"
					 , name.c_str()
					 );
		}).then([this]() {
			return bus.raise(T());
		}).then([this]() {
			return loop();
		});
	}

public:
	static
	std::shared_ptr<PeriodicLoop>
	create( std::string name
	      , S::Bus& bus
	      , Xswap::Mod::Waiter& waiter
	      , double period
	      ) {
		/* Cannot use std::make_shared, constructor is private.  */
		return std::shared_ptr<PeriodicLoop>(
			new PeriodicLoop(std::move(name), bus, waiter, period)
		);
	}

	Ev::Io<void> enter_loop() {
		auto self = PeriodicLoop<T>::shared_from_this();
		return self->loop().then([self]() {
			/* Never invoked; holding self in the
			 * continuation keeps the loop object
			 * alive until the loop is abandoned.  */
			return Ev::lift();
		});
	}
};

template<typename T>
Ev::Io<void> periodic_loop( std::string name
			  , S::Bus& bus
			  , Xswap::Mod::Waiter& waiter
			  , double period
			  ) {
	auto loop_obj = PeriodicLoop<T>::create(
		std::move(name), bus, waiter, period
	);
	return loop_obj->enter_loop();
}

}

namespace Xswap { namespace Mod {

void Timers::start() {
	bus.subscribe<Xswap::Msg::Init>([this](Xswap::Msg::Init const& _) {
		return Ev::lift().then([this]() {
			return Xswap::concurrent(periodic_loop<Xswap::Msg::TimerHealthCheck>(
				"health check", bus, waiter, intervals.health
			));
		}).then([this]() {
			return Xswap::concurrent(periodic_loop<Xswap::Msg::TimerAuctionRefresh>(
				"auction refresh", bus, waiter, intervals.auction
			));
		}).then([this]() {
			return Xswap::concurrent(periodic_loop<Xswap::Msg::TimerRecoveryScan>(
				"recovery scan", bus, waiter, intervals.recovery
			));
		});
	});
}

}}
