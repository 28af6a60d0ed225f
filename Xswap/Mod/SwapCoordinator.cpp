#include"Auction/rate.hpp"
#include"Chain/Error.hpp"
#include"Chain/LedgerAdapter.hpp"
#include"Ev/Io.hpp"
#include"Ev/foreach.hpp"
#include"Ev/now.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Sha256/fun.hpp"
#include"Util/make_unique.hpp"
#include"Xswap/Mod/CheckpointStore.hpp"
#include"Xswap/Mod/SwapCoordinator.hpp"
#include"Xswap/Mod/Waiter.hpp"
#include"Xswap/Msg/AuctionUpdate.hpp"
#include"Xswap/Msg/EscrowEventNotice.hpp"
#include"Xswap/Msg/SwapCompleted.hpp"
#include"Xswap/Msg/TimerAuctionRefresh.hpp"
#include"Xswap/Msg/TimerHealthCheck.hpp"
#include"Xswap/Msg/TimerRecoveryScan.hpp"
#include"Xswap/Shutdown.hpp"
#include"Xswap/concurrent.hpp"
#include"Xswap/log.hpp"
#include<algorithm>
#include<deque>
#include<initializer_list>
#include<map>
#include<set>
#include<stdexcept>

namespace Xswap { namespace Mod {

SwapCoordinator::Settings::Settings()
	: drain_timeout(10)
	, health_timeout(5)
	, clock([]() { return std::uint64_t(Ev::now()); })
	{ }

class SwapCoordinator::Impl {
private:
	S::Bus& bus;
	Waiter& waiter;
	CheckpointStore& checkpoints;
	std::vector<Chain::LedgerAdapter*> adapters;
	Settings settings;

	std::map<std::string, Order> orders;
	std::map<std::string, CrossChainSwap> swaps;
	ErrorLog errlog;
	Metrics metrics;
	double execution_time_total;
	std::uint64_t started_at;

	bool running;
	bool stopping;
	std::set<std::string> connected;

	/* Per chain: the block after the last delivered
	 * event, the blocks of events queued but not yet
	 * processed, and the last processed block.  */
	std::map<std::string, std::uint64_t> next_block;
	std::map<std::string, std::multiset<std::uint64_t>> queued_blocks;
	std::map<std::string, std::uint64_t> last_block;

	/* Per-order work queues.  An order has an entry
	 * here exactly while a greenthread is draining
	 * its queue.  */
	typedef std::function<Ev::Io<void>()> Task;
	std::map<std::string, std::deque<Task>> workers;
	std::vector<std::function<void()>> idle_waiters;

	std::uint64_t now() const { return settings.clock(); }

	Chain::LedgerAdapter* find_adapter(std::string const& chain) const {
		for (auto a : adapters)
			if (a->name() == chain)
				return a;
		return nullptr;
	}

	Ev::Io<void> record( ErrorRecord::Level level
			   , std::string msg
			   , std::string order_id
			   , std::string chain
			   ) {
		return Ev::lift().then([ this, level, msg
				       , order_id, chain
				       ]() {
			errlog.add(now(), level, msg, order_id, chain);
			auto l = level == ErrorRecord::Error ? Xswap::Error
			       : level == ErrorRecord::Warning ? Xswap::Warn
			       : Xswap::Info
			       ;
			return Xswap::log( bus, l
					 , "SwapCoordinator: %s%s%s%s%s"
					 , order_id.empty() ? "" : "order "
					 , order_id.c_str()
					 , chain.empty() ? "" : " on "
					 , chain.c_str()
					 , (": " + msg).c_str()
					 );
		});
	}

	/*~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
	 * Per-order serialization.
	 *~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~*/

	Ev::Io<void> enqueue(std::string const& order_id, Task task) {
		auto start = (workers.find(order_id) == workers.end());
		workers[order_id].push_back(std::move(task));
		if (!start)
			return Ev::lift();
		return Xswap::concurrent(drain(order_id));
	}

	Ev::Io<void> drain(std::string order_id) {
		return Ev::yield().then([this, order_id]() {
			auto it = workers.find(order_id);
			if (it->second.empty()) {
				workers.erase(it);
				if (workers.empty())
					wake_idle();
				return Ev::lift();
			}
			auto task = std::move(it->second.front());
			it->second.pop_front();
			return run_task(order_id, std::move(task)).then([this, order_id]() {
				return drain(order_id);
			});
		});
	}

	Ev::Io<void> run_task(std::string order_id, Task task) {
		return Ev::lift().then([task]() {
			return task();
		}).catching<std::exception>([this, order_id](std::exception const& e) {
			return record( ErrorRecord::Error
				     , std::string("unhandled: ") + e.what()
				     , order_id, ""
				     );
		}).catching<Xswap::Shutdown>([](Xswap::Shutdown const& _) {
			return Ev::lift();
		});
	}

	void wake_idle() {
		auto waiters = std::move(idle_waiters);
		idle_waiters.clear();
		for (auto& pass : waiters)
			/* Ev::yield cannot fail.  */
			Ev::yield().run(pass, [](std::exception_ptr) { });
	}

	/*~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
	 * Event intake.
	 *~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~*/

	Ev::Io<void> on_event(Chain::EscrowEvent ev) {
		if (stopping)
			return Xswap::log( bus, Xswap::Debug
					 , "SwapCoordinator: stopping, dropped %s "
					   "event at %s block %llu"
					 , Htlc::to_string(ev.event.type)
					 , ev.chain.c_str()
					 , (unsigned long long) ev.event.block_number
					 );

		auto const& chain = ev.chain;
		auto block = ev.event.block_number;
		auto& next = next_block[chain];
		if (block + 1 > next)
			next = block + 1;
		queued_blocks[chain].insert(block);

		auto order_id = ev.event.order_id;
		return enqueue(order_id, [this, ev]() {
			return process(ev);
		});
	}

	Ev::Io<void> process(Chain::EscrowEvent ev) {
		return Ev::lift().then([this, ev]() {
			return handle(ev);
		}).catching<std::exception>([this, ev](std::exception const& e) {
			return record( ErrorRecord::Error
				     , std::string("failed to process ")
				     + Htlc::to_string(ev.event.type)
				     + ": " + e.what()
				     , ev.event.order_id, ev.chain
				     );
		}).then([this, ev]() {
			auto const& chain = ev.chain;
			auto block = ev.event.block_number;
			auto& q = queued_blocks[chain];
			auto it = q.find(block);
			if (it != q.end())
				q.erase(it);
			auto& last = last_block[chain];
			if (block > last)
				last = block;
			return bus.raise(Xswap::Msg::EscrowEventNotice{ev});
		});
	}

	Ev::Io<void> handle(Chain::EscrowEvent const& ev) {
		switch (ev.event.type) {
		case Htlc::Event::Created:
			return on_created(ev);
		case Htlc::Event::Withdrawn:
			return on_withdrawn(ev);
		case Htlc::Event::Cancelled:
			return on_cancelled(ev);
		case Htlc::Event::Unknown:
			break;
		}
		return Xswap::log( bus, Xswap::Warn
				 , "SwapCoordinator: ignoring unknown event "
				   "type '%s' from %s"
				 , ev.event.type_name.c_str()
				 , ev.chain.c_str()
				 );
	}

	Leg* leg_of(CrossChainSwap& swap, Sha256::Hash const& escrow_id) {
		if (swap.source.state != Leg::Absent
		 && swap.source.escrow_id == escrow_id)
			return &swap.source;
		if (swap.dest.state != Leg::Absent
		 && swap.dest.escrow_id == escrow_id)
			return &swap.dest;
		return nullptr;
	}

	Order& ensure_order(Chain::EscrowEvent const& ev) {
		auto const& e = ev.event;
		auto it = orders.find(e.order_id);
		if (it != orders.end())
			return it->second;
		/* Not registered with us; rebuild it from
		 * the ledger.  */
		auto o = Order();
		o.order_id = e.order_id;
		o.secret_hash = e.secret_hash;
		++metrics.total_orders;
		return orders.insert(std::make_pair(e.order_id, o)).first->second;
	}
	CrossChainSwap& ensure_swap(std::string const& order_id) {
		auto it = swaps.find(order_id);
		if (it != swaps.end())
			return it->second;
		auto s = CrossChainSwap();
		s.order_id = order_id;
		s.created_at = now();
		s.updated_at = s.created_at;
		return swaps.insert(std::make_pair(order_id, s)).first->second;
	}

	Ev::Io<void> on_created(Chain::EscrowEvent const& ev) {
		auto const& e = ev.event;
		if (e.order_id.empty())
			return record( ErrorRecord::Warning
				     , "escrow created without an order id: "
				     + std::string(e.escrow_id)
				     , "", ev.chain
				     );

		auto& order = ensure_order(ev);
		auto& swap = ensure_swap(e.order_id);
		auto& leg = e.is_resolver_leg ? swap.dest : swap.source;

		if (leg.state != Leg::Absent) {
			if (leg.escrow_id == e.escrow_id)
				return Xswap::log( bus, Xswap::Debug
						 , "SwapCoordinator: order %s: "
						   "duplicate creation of %s"
						 , e.order_id.c_str()
						 , std::string(e.escrow_id).c_str()
						 );
			return record( ErrorRecord::Warning
				     , "second " + std::string(e.is_resolver_leg ? "destination" : "source")
				     + " escrow " + std::string(e.escrow_id)
				     + " ignored"
				     , e.order_id, ev.chain
				     );
		}

		leg.chain = ev.chain;
		leg.escrow_id = e.escrow_id;
		leg.state = Leg::Locked;
		leg.sender = e.sender;
		leg.receiver = e.receiver;
		leg.amount = e.amount;
		leg.timelock = e.timelock;
		leg.created_block = e.block_number;
		swap.updated_at = now();

		auto act = Ev::lift();
		if (order.secret_hash != e.secret_hash)
			act += record( ErrorRecord::Warning
				     , "escrow " + std::string(e.escrow_id)
				     + " is locked to a different secret hash"
				     , e.order_id, ev.chain
				     );

		if (!e.is_resolver_leg) {
			if (order.maker.empty())
				order.maker = e.sender;
			if (order.src_chain.empty())
				order.src_chain = ev.chain;
			if (order.src_asset.empty())
				order.src_asset = e.asset;
			if (order.src_amount == 0)
				order.src_amount = e.amount;
			if (order.timelock == 0)
				order.timelock = e.timelock;
			if (order.auction_end == 0) {
				order.auction_start = e.auction_start;
				order.auction_end = e.auction_end;
				order.start_rate = e.start_rate;
				order.end_rate = e.end_rate;
			}
			advance(order, Order::AuctionActive);
			advance(swap, CrossChainSwap::SourceLocked);
			if (swap.dest.state == Leg::Absent)
				swap.execution_deadline = e.timelock;

			act += Xswap::log( bus, Xswap::Info
					 , "SwapCoordinator: order %s: source escrow "
					   "%s locked on %s"
					 , e.order_id.c_str()
					 , std::string(e.escrow_id).c_str()
					 , ev.chain.c_str()
					 );
			/* The secret may already be known from the
			 * other chain.  */
			if (swap.has_secret && swap.dest.state == Leg::Withdrawn)
				act += counter_withdraw(e.order_id);
			return act;
		}

		if ( swap.source.state != Leg::Absent
		  && e.source_escrow_id
		  && e.source_escrow_id != swap.source.escrow_id
		   )
			act += record( ErrorRecord::Warning
				     , "destination escrow names source "
				     + std::string(e.source_escrow_id)
				     + ", expected "
				     + std::string(swap.source.escrow_id)
				     , e.order_id, ev.chain
				     );
		if (order.dest_chain.empty())
			order.dest_chain = ev.chain;
		if (order.dest_asset.empty())
			order.dest_asset = e.asset;
		if (order.dest_amount == 0)
			order.dest_amount = e.amount;
		if (order.receiver.empty())
			order.receiver = e.receiver;
		advance(order, Order::Accepted);
		advance(swap, CrossChainSwap::DestLocked);
		swap.execution_deadline = e.timelock;

		act += Xswap::log( bus, Xswap::Info
				 , "SwapCoordinator: order %s: destination escrow "
				   "%s locked on %s by %s"
				 , e.order_id.c_str()
				 , std::string(e.escrow_id).c_str()
				 , ev.chain.c_str()
				 , e.sender.c_str()
				 );
		return act;
	}

	Ev::Io<void> on_withdrawn(Chain::EscrowEvent const& ev) {
		auto const& e = ev.event;
		auto sit = swaps.find(e.order_id);
		if (sit == swaps.end())
			return record( ErrorRecord::Warning
				     , "withdrawal of untracked escrow "
				     + std::string(e.escrow_id)
				     , e.order_id, ev.chain
				     );
		auto& swap = sit->second;
		auto& order = orders.at(e.order_id);
		auto leg = leg_of(swap, e.escrow_id);
		if (!leg)
			return record( ErrorRecord::Warning
				     , "withdrawal of unknown escrow "
				     + std::string(e.escrow_id)
				     , e.order_id, ev.chain
				     );
		if (leg->state == Leg::Withdrawn)
			return Xswap::log( bus, Xswap::Debug
					 , "SwapCoordinator: order %s: "
					   "duplicate withdrawal of %s"
					 , e.order_id.c_str()
					 , std::string(e.escrow_id).c_str()
					 );
		if (leg->state == Leg::Cancelled)
			return record( ErrorRecord::Error
				     , "withdrawal of already refunded escrow "
				     + std::string(e.escrow_id)
				     , e.order_id, ev.chain
				     );

		if (Sha256::fun(e.secret) != order.secret_hash)
			return fail( e.order_id
				   , "revealed secret does not match the "
				     "order's secret hash"
				   , ev.chain
				   );

		leg->state = Leg::Withdrawn;
		swap.has_secret = true;
		swap.secret = e.secret;
		swap.updated_at = now();
		advance(swap, CrossChainSwap::SecretRevealed);
		advance(order, Order::Executing);

		if (leg == &swap.dest) {
			auto act = Xswap::log( bus, Xswap::Info
					     , "SwapCoordinator: order %s: secret "
					       "revealed on destination %s at rate %s"
					     , e.order_id.c_str()
					     , ev.chain.c_str()
					     , Auction::display_rate(e.execution_rate).c_str()
					     );
			return act + counter_withdraw(e.order_id);
		}

		/* Source leg.  If it is our own counter-withdrawal,
		 * completion waits for its confirmation.  */
		if (swap.counter_withdraw_pending)
			return Ev::lift();
		return complete(e.order_id);
	}

	Ev::Io<void> on_cancelled(Chain::EscrowEvent const& ev) {
		auto const& e = ev.event;
		auto sit = swaps.find(e.order_id);
		if (sit == swaps.end())
			return record( ErrorRecord::Warning
				     , "cancellation of untracked escrow "
				     + std::string(e.escrow_id)
				     , e.order_id, ev.chain
				     );
		auto& swap = sit->second;
		auto& order = orders.at(e.order_id);
		auto leg = leg_of(swap, e.escrow_id);
		if (!leg)
			return record( ErrorRecord::Warning
				     , "cancellation of unknown escrow "
				     + std::string(e.escrow_id)
				     , e.order_id, ev.chain
				     );
		if (leg->state == Leg::Cancelled)
			return Xswap::log( bus, Xswap::Debug
					 , "SwapCoordinator: order %s: "
					   "duplicate cancellation of %s"
					 , e.order_id.c_str()
					 , std::string(e.escrow_id).c_str()
					 );

		leg->state = Leg::Cancelled;
		swap.updated_at = now();
		auto msg = "escrow " + std::string(e.escrow_id)
			 + " refunded " + std::to_string(e.refund_amount)
			 + " to " + e.sender
			 ;
		if (swap.terminal())
			return Xswap::log( bus, Xswap::Info
					 , "SwapCoordinator: order %s: %s"
					 , e.order_id.c_str(), msg.c_str()
					 );

		auto recovering = (swap.status == CrossChainSwap::Recovering);
		advance(swap, CrossChainSwap::Failed);
		if (recovering) {
			advance(order, Order::Expired);
			++metrics.failed_orders;
		} else {
			advance(order, Order::Cancelled);
			++metrics.cancelled_orders;
		}
		return record( ErrorRecord::Info
			     , msg + (recovering ? ", order expired" : ", order cancelled")
			     , e.order_id, ev.chain
			     );
	}

	/*~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
	 * Settlement.
	 *~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~*/

	Ev::Io<void> counter_withdraw(std::string order_id) {
		auto& swap = swaps.at(order_id);
		if (swap.terminal())
			return Ev::lift();
		switch (swap.source.state) {
		case Leg::Withdrawn:
			return complete(order_id);
		case Leg::Absent:
			return Xswap::log( bus, Xswap::Info
					 , "SwapCoordinator: order %s: source "
					   "escrow not seen yet, withdrawal deferred"
					 , order_id.c_str()
					 );
		case Leg::Cancelled:
			return fail( order_id
				   , "source escrow refunded before the "
				     "secret could be used"
				   , swap.source.chain
				   );
		case Leg::Locked:
			break;
		}
		if (swap.counter_withdraw_pending)
			return await_counter(order_id)
				.catching<Chain::TransientError>([ this, order_id
								 ](Chain::TransientError const& e) {
				return record( ErrorRecord::Warning
					     , std::string("withdrawal not confirmed yet: ")
					     + e.what()
					     , order_id, swaps.at(order_id).source.chain
					     );
			});
		if (swap.counter_withdraw_submitted)
			return Ev::lift();

		auto chain = swap.source.chain;
		auto adapter = find_adapter(chain);
		if (!adapter)
			return record( ErrorRecord::Error
				     , "no adapter for source chain"
				     , order_id, chain
				     );
		if (stopping)
			return Xswap::log( bus, Xswap::Warn
					 , "SwapCoordinator: order %s: stopping, "
					   "withdrawal on %s not submitted"
					 , order_id.c_str(), chain.c_str()
					 );

		swap.counter_withdraw_submitted = true;
		auto escrow = swap.source.escrow_id;
		auto secret = swap.secret;
		return Xswap::log( bus, Xswap::Info
				 , "SwapCoordinator: order %s: withdrawing "
				   "source escrow %s on %s"
				 , order_id.c_str()
				 , std::string(escrow).c_str()
				 , chain.c_str()
				 ).then([adapter, escrow, secret]() {
			return adapter->submit_withdraw(escrow, secret);
		}).then([this, order_id](Chain::TxHandle h) {
			auto& s = swaps.at(order_id);
			s.counter_withdraw = std::move(h);
			s.counter_withdraw_pending = true;
			return await_counter(order_id);
		}).catching<Chain::TransientError>([ this, order_id
						   , chain
						   ](Chain::TransientError const& e) {
			auto& s = swaps.at(order_id);
			if (!s.counter_withdraw_pending)
				s.counter_withdraw_submitted = false;
			return record( ErrorRecord::Warning
				     , std::string("withdrawal delayed, will retry: ")
				     + e.what()
				     , order_id, chain
				     );
		}).catching<Chain::RevertedError>([ this, order_id
						  , chain
						  ](Chain::RevertedError const& e) {
			return counter_reverted(order_id, chain, e.code(), e.what());
		});
	}

	Ev::Io<void> await_counter(std::string order_id) {
		auto& swap = swaps.at(order_id);
		auto adapter = find_adapter(swap.source.chain);
		if (!adapter)
			return Ev::lift();
		auto handle = swap.counter_withdraw;
		return adapter->wait_confirmed( handle
					      , adapter->config().confirmations
					      ).then([this, order_id]() {
			auto& s = swaps.at(order_id);
			s.counter_withdraw_pending = false;
			s.source.state = Leg::Withdrawn;
			return complete(order_id);
		});
	}

	Ev::Io<void> counter_reverted( std::string const& order_id
				     , std::string const& chain
				     , Htlc::ErrorCode code
				     , std::string const& what
				     ) {
		auto& swap = swaps.at(order_id);
		swap.counter_withdraw_pending = false;
		switch (code) {
		case Htlc::AlreadyWithdrawn:
			swap.source.state = Leg::Withdrawn;
			return Xswap::log( bus, Xswap::Info
					 , "SwapCoordinator: order %s: source "
					   "escrow already withdrawn"
					 , order_id.c_str()
					 ) + complete(order_id);
		case Htlc::InvalidSecret:
			return fail( order_id
				   , "source ledger rejected the revealed secret"
				   , chain
				   );
		default:
			return fail( order_id
				   , "withdrawal reverted: " + what
				   , chain
				   );
		}
	}

	Ev::Io<void> complete(std::string const& order_id) {
		auto& swap = swaps.at(order_id);
		auto& order = orders.at(order_id);
		if (swap.terminal())
			return Ev::lift();
		auto t = now();
		advance(swap, CrossChainSwap::Completed);
		swap.completed_at = t;
		swap.updated_at = t;
		advance(order, Order::Completed);

		++metrics.successful_orders;
		metrics.total_volume += order.src_amount;
		execution_time_total += double(t >= swap.created_at ? t - swap.created_at : 0);
		metrics.average_execution_time = execution_time_total
					       / double(metrics.successful_orders)
					       ;

		auto msg = Xswap::Msg::SwapCompleted{order, swap};
		return Xswap::log( bus, Xswap::Info
				 , "SwapCoordinator: order %s: swap completed"
				 , order_id.c_str()
				 ).then([this, msg]() {
			return bus.raise(msg);
		});
	}

	Ev::Io<void> fail( std::string const& order_id
			 , std::string const& why
			 , std::string const& chain
			 ) {
		auto& swap = swaps.at(order_id);
		auto& order = orders.at(order_id);
		if (!swap.terminal())
			++metrics.failed_orders;
		advance(swap, CrossChainSwap::Failed);
		swap.updated_at = now();
		advance(order, Order::Failed);
		return record(ErrorRecord::Error, why, order_id, chain);
	}

	/*~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
	 * Recovery.
	 *~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~*/

	/* Whether a leg still holds value we may refund.  */
	bool ours_locked(Leg const& leg) const {
		if (leg.state != Leg::Locked)
			return false;
		auto a = find_adapter(leg.chain);
		return a && leg.sender == a->account();
	}
	/* Whether a leg still needs a refund from us or a
	 * notice to its sender.  */
	bool unreclaimed(Leg const& leg) const {
		return leg.state == Leg::Locked
		    && !leg.cancel_submitted
		    && !leg.reclaim_notified
		     ;
	}
	bool needs_recovery(CrossChainSwap const& s) const {
		if (!s.terminal())
			return true;
		if (s.status != CrossChainSwap::Failed)
			return false;
		return unreclaimed(s.source) || unreclaimed(s.dest);
	}

	Ev::Io<void> recover(std::string order_id) {
		auto& swap = swaps.at(order_id);
		if (!swap.terminal() && swap.has_secret) {
			if (swap.source.state == Leg::Locked)
				return counter_withdraw(order_id);
			return Ev::lift();
		}

		auto act = Ev::lift();
		auto t = now();
		if ( !swap.terminal()
		  && swap.execution_deadline != 0
		  && t >= swap.execution_deadline
		  && advance(swap, CrossChainSwap::Recovering)
		   ) {
			swap.updated_at = t;
			act += record( ErrorRecord::Warning
				     , "execution deadline passed, recovering"
				     , order_id, ""
				     );
		}
		if ( swap.status == CrossChainSwap::Recovering
		  || swap.status == CrossChainSwap::Failed
		   ) {
			act += reclaim(order_id, true);
			act += reclaim(order_id, false);
		}
		return act;
	}

	Ev::Io<void> reclaim(std::string order_id, bool source) {
		return Ev::lift().then([this, order_id, source]() {
			auto& swap = swaps.at(order_id);
			auto& leg = source ? swap.source : swap.dest;
			if (leg.state != Leg::Locked || leg.cancel_submitted)
				return Ev::lift();
			/* The ledger refuses before the timelock.  */
			if (now() < leg.timelock)
				return Ev::lift();

			auto chain = leg.chain;
			auto escrow = leg.escrow_id;
			auto adapter = find_adapter(chain);
			if (!adapter || leg.sender != adapter->account()) {
				if (leg.reclaim_notified)
					return Ev::lift();
				leg.reclaim_notified = true;
				return record( ErrorRecord::Info
					     , "sender " + leg.sender
					     + " may now cancel escrow "
					     + std::string(escrow)
					     , order_id, chain
					     );
			}
			if (stopping)
				return Ev::lift();

			leg.cancel_submitted = true;
			return Xswap::log( bus, Xswap::Info
					 , "SwapCoordinator: order %s: cancelling "
					   "our escrow %s on %s"
					 , order_id.c_str()
					 , std::string(escrow).c_str()
					 , chain.c_str()
					 ).then([adapter, escrow]() {
				return adapter->submit_cancel(escrow);
			}).then([this, order_id](Chain::TxHandle h) {
				return Xswap::log( bus, Xswap::Debug
						 , "SwapCoordinator: order %s: "
						   "cancel included in block %llu"
						 , order_id.c_str()
						 , (unsigned long long) h.block_number
						 );
			}).catching<Chain::TransientError>([ this, order_id
							   , source, chain
							   ](Chain::TransientError const& e) {
				auto& s = swaps.at(order_id);
				(source ? s.source : s.dest).cancel_submitted = false;
				return record( ErrorRecord::Warning
					     , std::string("cancel delayed, will retry: ")
					     + e.what()
					     , order_id, chain
					     );
			}).catching<Chain::RevertedError>([ this, order_id
							  , chain
							  ](Chain::RevertedError const& e) {
				/* Settled meanwhile; its event follows.  */
				if ( e.code() == Htlc::AlreadyWithdrawn
				  || e.code() == Htlc::AlreadyCancelled
				   )
					return Ev::lift();
				return record( ErrorRecord::Error
					     , std::string("cancel reverted: ")
					     + e.what()
					     , order_id, chain
					     );
			});
		});
	}

	/*~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
	 * Health.
	 *~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~*/

	Ev::Io<void> check_one(Chain::LedgerAdapter* a) {
		auto name = a->name();
		return waiter.timed( settings.health_timeout
				   , a->is_healthy()
				   ).catching<Waiter::TimedOut>([](Waiter::TimedOut const& _) {
			return Ev::lift(false);
		}).catching<std::exception>([](std::exception const& _) {
			return Ev::lift(false);
		}).then([this, name](bool healthy) {
			if (healthy) {
				if (connected.insert(name).second)
					return Xswap::log( bus, Xswap::Info
							 , "SwapCoordinator: %s is healthy"
							 , name.c_str()
							 );
				return Ev::lift();
			}
			connected.erase(name);
			return record( ErrorRecord::Warning
				     , "health check failed"
				     , "", name
				     );
		});
	}

public:
	Impl( S::Bus& bus_
	    , Waiter& waiter_
	    , CheckpointStore& checkpoints_
	    , std::vector<Chain::LedgerAdapter*> adapters_
	    , Settings settings_
	    ) : bus(bus_)
	      , waiter(waiter_)
	      , checkpoints(checkpoints_)
	      , adapters(std::move(adapters_))
	      , settings(std::move(settings_))
	      , execution_time_total(0)
	      , started_at(0)
	      , running(false)
	      , stopping(false)
	      {
		bus.subscribe<Xswap::Msg::TimerHealthCheck
			     >([this](Xswap::Msg::TimerHealthCheck const& _) {
			return check_health();
		});
		bus.subscribe<Xswap::Msg::TimerAuctionRefresh
			     >([this](Xswap::Msg::TimerAuctionRefresh const& _) {
			return refresh_auctions();
		});
		bus.subscribe<Xswap::Msg::TimerRecoveryScan
			     >([this](Xswap::Msg::TimerRecoveryScan const& _) {
			return scan_recovery().then([this]() {
				return save_checkpoints();
			});
		});
	}

	Ev::Io<void> start() {
		auto act = Ev::lift().then([this]() {
			running = true;
			started_at = now();
			return Ev::lift();
		});
		for (auto a : adapters) {
			auto name = a->name();
			act += checkpoints.load(name).then([this, a, name](std::uint64_t from) {
				next_block[name] = from;
				return a->subscribe(from, [this](Chain::EscrowEvent ev) {
					return on_event(std::move(ev));
				});
			}).then([this, name]() {
				connected.insert(name);
				return Ev::lift();
			}).catching<std::exception>([this, name](std::exception const& e) {
				return record( ErrorRecord::Error
					     , std::string("cannot subscribe: ") + e.what()
					     , "", name
					     );
			});
		}
		return act;
	}

	Ev::Io<void> stop() {
		return Ev::lift().then([this]() {
			if (stopping)
				return Ev::lift();
			stopping = true;
			/* Handlers still draining may not reach a
			 * ledger, not even through a pending retry.  */
			return Ev::foreach([](Chain::LedgerAdapter* a) {
				return a->refuse_submissions();
			}, adapters).then([this]() {
				return Xswap::log( bus, Xswap::Info
						 , "SwapCoordinator: stopping, %zu orders busy"
						 , workers.size()
						 );
			}).then([this]() {
				return waiter.timed(settings.drain_timeout, idle());
			}).catching<Waiter::TimedOut>([this](Waiter::TimedOut const& _) {
				return record( ErrorRecord::Warning
					     , "gave up waiting for "
					     + std::to_string(workers.size())
					     + " busy orders"
					     , "", ""
					     );
			}).then([this]() {
				return save_checkpoints();
			}).catching<std::exception>([this](std::exception const& e) {
				return record( ErrorRecord::Error
					     , std::string("cannot save checkpoints: ")
					     + e.what()
					     , "", ""
					     );
			}).then([this]() {
				return Ev::foreach([](Chain::LedgerAdapter* a) {
					return a->close();
				}, adapters);
			}).catching<std::exception>([this](std::exception const& e) {
				return record( ErrorRecord::Error
					     , std::string("cannot close adapter: ")
					     + e.what()
					     , "", ""
					     );
			}).then([this]() {
				running = false;
				connected.clear();
				return Xswap::log( bus, Xswap::Info
						 , "SwapCoordinator: stopped"
						 );
			});
		});
	}

	void register_order(Order order) {
		if (order.order_id.empty())
			throw std::invalid_argument(
				"register_order: empty order id"
			);
		/* No secret ever hashes to zero.  */
		if (!order.secret_hash)
			throw std::invalid_argument(
				"register_order: zero secret hash for "
				+ order.order_id
			);
		if (orders.find(order.order_id) != orders.end())
			throw std::invalid_argument(
				"register_order: duplicate order " + order.order_id
			);
		order.status = Order::Pending;
		auto id = order.order_id;
		orders.insert(std::make_pair(std::move(id), std::move(order)));
		++metrics.total_orders;
	}

	std::unique_ptr<Order> get_order(std::string const& order_id) const {
		auto it = orders.find(order_id);
		if (it == orders.end())
			return nullptr;
		return Util::make_unique<Order>(it->second);
	}
	std::unique_ptr<CrossChainSwap> get_swap(std::string const& order_id) const {
		auto it = swaps.find(order_id);
		if (it == swaps.end())
			return nullptr;
		return Util::make_unique<CrossChainSwap>(it->second);
	}

	State get_state() const {
		auto st = State();
		st.running = running;
		st.connected_chains = std::vector<std::string>( connected.begin()
							      , connected.end()
							      );
		st.last_block = last_block;
		for (auto const& s : swaps)
			if (!s.second.terminal())
				st.pending_swaps.push_back(s.second);
		for (auto const& o : orders)
			if (!o.second.terminal())
				st.active_orders.push_back(o.second);
		st.metrics = metrics;
		if (running) {
			auto t = now();
			st.metrics.uptime = t >= started_at ? t - started_at : 0;
		}
		st.errors = errlog.recent(100);
		return st;
	}
	ErrorLog const& errors() const { return errlog; }

	Ev::Io<void> check_health() {
		return Ev::lift().then([this]() {
			if (stopping)
				return Ev::lift();
			return Ev::foreach([this](Chain::LedgerAdapter* a) {
				return check_one(a);
			}, adapters);
		});
	}

	Ev::Io<void> refresh_auctions() {
		return Ev::lift().then([this]() {
			auto t = now();
			auto act = Ev::lift();
			for (auto const& o : orders) {
				auto const& order = o.second;
				if (order.status != Order::AuctionActive)
					continue;
				if (order.auction_end <= order.auction_start)
					continue;
				auto duration = order.auction_end - order.auction_start;
				auto elapsed = std::uint64_t(0);
				if (t > order.auction_start)
					elapsed = std::min(t - order.auction_start, duration);
				auto up = Xswap::Msg::AuctionUpdate{
					order.order_id,
					Auction::current_rate( order.start_rate
							     , order.end_rate
							     , order.auction_start
							     , order.auction_end
							     , t
							     ),
					elapsed,
					duration,
					100.0 * double(elapsed) / double(duration),
					t >= order.auction_start && t < order.auction_end
				};
				act += bus.raise(std::move(up));
			}
			return act;
		});
	}

	Ev::Io<void> scan_recovery() {
		return Ev::lift().then([this]() {
			if (stopping)
				return Ev::lift();
			auto act = Ev::lift();
			for (auto const& s : swaps) {
				if (!needs_recovery(s.second))
					continue;
				auto order_id = s.first;
				act += enqueue(order_id, [this, order_id]() {
					return recover(order_id);
				});
			}
			return act;
		});
	}

	std::uint64_t checkpoint(std::string const& chain) const {
		auto it = next_block.find(chain);
		auto cp = (it == next_block.end()) ? std::uint64_t(0) : it->second;
		auto qit = queued_blocks.find(chain);
		if (qit != queued_blocks.end() && !qit->second.empty())
			cp = std::min(cp, *qit->second.begin());
		for (auto const& s : swaps) {
			auto const& swap = s.second;
			auto open = !swap.terminal();
			for (auto leg : {&swap.source, &swap.dest}) {
				if (leg->state == Leg::Absent || leg->chain != chain)
					continue;
				if (open || ours_locked(*leg))
					cp = std::min(cp, leg->created_block);
			}
		}
		return cp;
	}

	Ev::Io<void> save_checkpoints() {
		return Ev::lift().then([this]() {
			auto act = Ev::lift();
			for (auto a : adapters) {
				auto name = a->name();
				if (next_block.find(name) == next_block.end())
					continue;
				act += checkpoints.save(name, checkpoint(name));
			}
			return act;
		});
	}

	Ev::Io<void> idle() {
		return Ev::Io<void>([this]( std::function<void()> pass
					  , std::function<void(std::exception_ptr)> fail
					  ) {
			if (workers.empty())
				return pass();
			idle_waiters.push_back(std::move(pass));
		});
	}
};

SwapCoordinator::SwapCoordinator( S::Bus& bus
				, Waiter& waiter
				, CheckpointStore& checkpoints
				, std::vector<Chain::LedgerAdapter*> adapters
				, Settings settings
				) : pimpl(Util::make_unique<Impl>( bus, waiter
								 , checkpoints
								 , std::move(adapters)
								 , std::move(settings)
								 ))
				  { }
SwapCoordinator::~SwapCoordinator() { }

Ev::Io<void> SwapCoordinator::start() {
	return pimpl->start();
}
Ev::Io<void> SwapCoordinator::stop() {
	return pimpl->stop();
}
void SwapCoordinator::register_order(Order order) {
	pimpl->register_order(std::move(order));
}
std::unique_ptr<Order>
SwapCoordinator::get_order(std::string const& order_id) const {
	return pimpl->get_order(order_id);
}
std::unique_ptr<CrossChainSwap>
SwapCoordinator::get_swap(std::string const& order_id) const {
	return pimpl->get_swap(order_id);
}
State SwapCoordinator::get_state() const {
	return pimpl->get_state();
}
ErrorLog const& SwapCoordinator::errors() const {
	return pimpl->errors();
}
Ev::Io<void> SwapCoordinator::check_health() {
	return pimpl->check_health();
}
Ev::Io<void> SwapCoordinator::refresh_auctions() {
	return pimpl->refresh_auctions();
}
Ev::Io<void> SwapCoordinator::scan_recovery() {
	return pimpl->scan_recovery();
}
Ev::Io<void> SwapCoordinator::save_checkpoints() {
	return pimpl->save_checkpoints();
}
std::uint64_t SwapCoordinator::checkpoint(std::string const& chain) const {
	return pimpl->checkpoint(chain);
}
Ev::Io<void> SwapCoordinator::idle() {
	return pimpl->idle();
}

}}
