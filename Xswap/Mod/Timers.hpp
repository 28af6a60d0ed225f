#ifndef XSWAP_MOD_TIMERS_HPP
#define XSWAP_MOD_TIMERS_HPP

namespace Xswap { namespace Mod { class Waiter; }}
namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Xswap { namespace Mod {

/** class Xswap::Mod::Timers
 *
 * @brief emits the periodic messages that drive the
 * coordinator's background loops, starting at
 * `Xswap::Msg::Init`.
 *
 * @desc Emits:
 *
 * - Xswap::Msg::TimerHealthCheck
 *   Every `health` seconds (default 30).
 * - Xswap::Msg::TimerAuctionRefresh
 *   Every `auction` seconds (default 1).
 * - Xswap::Msg::TimerRecoveryScan
 *   Every `recovery` seconds (default 10).
 *
 * Each loop waits for its handlers to finish
 * before scheduling the next tick, so a slow tick
 * delays only its own loop.
 */
class Timers {
public:
	struct Intervals {
		double health;
		double auction;
		double recovery;

		Intervals() : health(30), auction(1), recovery(10) { }
	};

private:
	S::Bus& bus;
	Xswap::Mod::Waiter& waiter;
	Intervals intervals;

	void start();

public:
	Timers( S::Bus& bus_
	      , Xswap::Mod::Waiter& waiter_
	      , Intervals intervals_ = Intervals()
	      ) : bus(bus_)
		, waiter(waiter_)
		, intervals(intervals_)
		{
		start();
	}
};

}}

#endif /* XSWAP_MOD_TIMERS_HPP */
