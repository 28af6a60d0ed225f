#ifndef XSWAP_MOD_SWAPCOORDINATOR_HPP
#define XSWAP_MOD_SWAPCOORDINATOR_HPP

#include"Xswap/CrossChainSwap.hpp"
#include"Xswap/ErrorLog.hpp"
#include"Xswap/Order.hpp"
#include"Xswap/State.hpp"
#include<cstdint>
#include<functional>
#include<memory>
#include<string>
#include<vector>

namespace Chain { class LedgerAdapter; }
namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Xswap { namespace Mod { class CheckpointStore; }}
namespace Xswap { namespace Mod { class Waiter; }}

namespace Xswap { namespace Mod {

/** class Xswap::Mod::SwapCoordinator
 *
 * @brief watches the escrow ledgers of every
 * configured chain and drives each order's two legs
 * to settlement or refund.
 *
 * @desc Ledger events are queued per order and each
 * order's queue is processed by its own greenthread,
 * so events of one order are applied strictly one at
 * a time and in delivery order, while unrelated
 * orders proceed independently.
 *
 * The periodic work is triggered by
 * `Xswap::Msg::TimerHealthCheck`,
 * `Xswap::Msg::TimerAuctionRefresh` and
 * `Xswap::Msg::TimerRecoveryScan`; each is also
 * callable directly.
 *
 * Emits `Xswap::Msg::EscrowEventNotice`,
 * `Xswap::Msg::SwapCompleted` and
 * `Xswap::Msg::AuctionUpdate` for the feed.
 */
class SwapCoordinator {
public:
	struct Settings {
		/* Bound on waiting for per-order work at stop().  */
		double drain_timeout;
		/* Bound on each adapter's is_healthy().  */
		double health_timeout;
		/* Seconds since the epoch; defaults to the
		 * event loop clock.  */
		std::function<std::uint64_t()> clock;

		Settings();
	};

private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	SwapCoordinator() =delete;
	SwapCoordinator(SwapCoordinator const&) =delete;
	SwapCoordinator(SwapCoordinator&&) =delete;
	~SwapCoordinator();

	/* The adapters must outlive the coordinator.  */
	SwapCoordinator( S::Bus& bus
		       , Xswap::Mod::Waiter& waiter
		       , Xswap::Mod::CheckpointStore& checkpoints
		       , std::vector<Chain::LedgerAdapter*> adapters
		       , Settings settings = Settings()
		       );

	/** Xswap::Mod::SwapCoordinator::start
	 *
	 * @brief subscribes to every adapter from its
	 * stored checkpoint.
	 *
	 * @desc An adapter that cannot be subscribed is
	 * logged and left out; the others still start.
	 */
	Ev::Io<void> start();

	/** Xswap::Mod::SwapCoordinator::stop
	 *
	 * @brief stops accepting events, waits (bounded)
	 * for queued per-order work, saves checkpoints
	 * and closes every adapter.
	 *
	 * @desc Nothing is submitted to any ledger once
	 * this has been called: every adapter is told to
	 * refuse submissions before the drain starts.
	 */
	Ev::Io<void> stop();

	/** Xswap::Mod::SwapCoordinator::register_order
	 *
	 * @brief records a maker's swap intent as
	 * `Pending`.
	 *
	 * @desc Throws `std::invalid_argument` if the
	 * order id is empty or already known, or the
	 * secret hash is zero.
	 */
	void register_order(Order order);

	/* Null if unknown.  */
	std::unique_ptr<Order> get_order(std::string const& order_id) const;
	std::unique_ptr<CrossChainSwap> get_swap(std::string const& order_id) const;
	State get_state() const;
	ErrorLog const& errors() const;

	Ev::Io<void> check_health();
	Ev::Io<void> refresh_auctions();
	Ev::Io<void> scan_recovery();
	Ev::Io<void> save_checkpoints();

	/* The block each chain's delivery would resume
	 * from if restarted now.  */
	std::uint64_t checkpoint(std::string const& chain) const;

	/* Completes once no per-order work is queued or
	 * running.  */
	Ev::Io<void> idle();
};

}}

#endif /* !defined(XSWAP_MOD_SWAPCOORDINATOR_HPP) */
