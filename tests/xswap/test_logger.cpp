#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Xswap/Mod/JsonOutputter.hpp"
#include"Xswap/Mod/Logger.hpp"
#include"Xswap/Mod/Timers.hpp"
#include"Xswap/Mod/Waiter.hpp"
#include"Xswap/Msg/Init.hpp"
#include"Xswap/Msg/JsonCout.hpp"
#include"Xswap/Msg/TimerAuctionRefresh.hpp"
#include"Xswap/Msg/TimerHealthCheck.hpp"
#include"Xswap/Msg/TimerRecoveryScan.hpp"
#include"Xswap/Shutdown.hpp"
#include"Xswap/log.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>

namespace {

std::size_t lines(std::string const& s) {
	auto n = std::size_t(0);
	for (auto c : s)
		if (c == '\n')
			++n;
	return n;
}

}

int main() {
	assert(Xswap::log_level_from_string("warn") == Xswap::Warn);
	assert(std::string(Xswap::to_string(Xswap::Debug)) == "debug");
	{
		auto thrown = false;
		try {
			Xswap::log_level_from_string("loud");
		} catch (std::invalid_argument const&) {
			thrown = true;
		}
		assert(thrown);
	}

	auto bus = S::Bus();
	Xswap::Mod::Waiter waiter(bus);
	auto err = std::ostringstream();
	auto out = std::ostringstream();
	Xswap::Mod::Logger logger(bus, err, Xswap::Info);
	Xswap::Mod::JsonOutputter outputter(out, bus);

	auto ticks = Xswap::Mod::Timers::Intervals();
	ticks.health = 0.02;
	ticks.auction = 0.01;
	ticks.recovery = 0.03;
	Xswap::Mod::Timers timers(bus, waiter, ticks);
	auto health = 0;
	auto auction = 0;
	auto recovery = 0;
	bus.subscribe<Xswap::Msg::TimerHealthCheck
		     >([&](Xswap::Msg::TimerHealthCheck const& _) {
		++health;
		return Ev::lift();
	});
	bus.subscribe<Xswap::Msg::TimerAuctionRefresh
		     >([&](Xswap::Msg::TimerAuctionRefresh const& _) {
		++auction;
		return Ev::lift();
	});
	bus.subscribe<Xswap::Msg::TimerRecoveryScan
		     >([&](Xswap::Msg::TimerRecoveryScan const& _) {
		++recovery;
		return Ev::lift();
	});

	auto code = Ev::lift().then([&]() {
		return Xswap::log(bus, Xswap::Debug, "hidden %d", 1);
	}).then([&]() {
		assert(err.str().empty());
		return Xswap::log(bus, Xswap::Warn, "chain %s unreachable", "dst");
	}).then([&]() {
		auto s = err.str();
		assert(lines(s) == 1);
		assert(s.find("\"level\": \"warn\"") != std::string::npos);
		assert(s.find("\"message\": \"chain dst unreachable\"") != std::string::npos);

		logger.set_level(Xswap::Trace);
		return Xswap::log(bus, Xswap::Trace, "now shown");
	}).then([&]() {
		assert(lines(err.str()) == 2);

		/* JSON output keeps its order.  */
		auto a = Json::Out().start_object().field("n", 1).end_object();
		auto b = Json::Out().start_object().field("n", 2).end_object();
		return bus.raise(Xswap::Msg::JsonCout{a})
		     + bus.raise(Xswap::Msg::JsonCout{b})
		     + Ev::yield(5)
		     ;
	}).then([&]() {
		assert(out.str() == "{\"n\": 1}\n{\"n\": 2}\n");
		assert(outputter.written() == 2);

		/* Timers only start ticking on Init.  */
		return waiter.wait(0.05);
	}).then([&]() {
		assert(health == 0 && auction == 0 && recovery == 0);
		return bus.raise(Xswap::Msg::Init());
	}).then([&]() {
		return waiter.wait(0.1);
	}).then([&]() {
		assert(auction > 0);
		assert(health > 0);
		assert(recovery > 0);
		assert(auction >= recovery);
		return bus.raise(Xswap::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
