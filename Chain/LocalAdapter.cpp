#include"Chain/Error.hpp"
#include"Chain/LocalAdapter.hpp"
#include"Chain/LocalChain.hpp"
#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Htlc/Error.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include"Xswap/Mod/Waiter.hpp"
#include"Xswap/concurrent.hpp"
#include"Xswap/log.hpp"
#include<algorithm>
#include<deque>

namespace Chain {

class LocalAdapter::Impl {
private:
	S::Bus& bus;
	Xswap::Mod::Waiter& waiter;
	LocalChain& chain;
	Config cfg;
	RetryPolicy retry;

	bool reachable;
	bool closed;
	bool refusing;
	std::size_t failures_pending;
	std::deque<Htlc::Event> injected;

	bool subscribed;
	std::uint64_t cursor;
	std::function<Ev::Io<void>(Chain::EscrowEvent)> on_event;

	void check_available() const {
		if (closed)
			throw TransientError(cfg.name + ": adapter closed");
		if (!reachable)
			throw TransientError(cfg.name + ": chain unreachable");
	}

	/* Applies a ledger transaction once.  */
	TxHandle attempt(std::function<Htlc::Receipt()> const& op) {
		if (refusing)
			throw TransientError(cfg.name + ": submissions refused");
		check_available();
		if (failures_pending > 0) {
			--failures_pending;
			throw TransientError(cfg.name + ": submission dropped");
		}
		try {
			auto r = op();
			return TxHandle{cfg.name, r.tx_hash, r.escrow_id, r.block_number};
		} catch (Htlc::Error const& e) {
			throw RevertedError(e.code(), e.what());
		}
	}

	Ev::Io<TxHandle> submit( std::string what
			       , std::function<Htlc::Receipt()> op
			       , std::size_t attempt_num
			       , double backoff
			       ) {
		return Ev::lift().then([ this, what, op
				       , attempt_num, backoff
				       ]() -> Ev::Io<TxHandle> {
			try {
				return Ev::lift(attempt(op));
			} catch (TransientError const& e) {
				if (closed || refusing
				 || attempt_num >= retry.max_attempts)
					throw;
				auto msg = std::string(e.what());
				auto next_backoff = std::min( backoff * 2
							    , retry.max_backoff
							    );
				return Xswap::log( bus, Xswap::Warn
						 , "%s: %s failed (attempt %zu of %zu): %s; "
						   "retrying in %.3f seconds"
						 , cfg.name.c_str(), what.c_str()
						 , attempt_num, retry.max_attempts
						 , msg.c_str(), backoff
						 ).then([this, backoff]() {
					return waiter.wait(backoff);
				}).then([ this, what, op
					, attempt_num, next_backoff
					]() {
					return submit( what, op
						     , attempt_num + 1
						     , next_backoff
						     );
				});
			}
		});
	}

	Ev::Io<void> deliver_loop() {
		return Ev::yield().then([this]() -> Ev::Io<void> {
			if (closed)
				return Ev::lift();
			if (!reachable)
				return chain.wait_change().then([this]() {
					return deliver_loop();
				});

			auto ev = Htlc::Event();
			if (!injected.empty()) {
				ev = std::move(injected.front());
				injected.pop_front();
			} else {
				auto evs = chain.ledger().events_since(cursor);
				if (evs.empty())
					return chain.wait_change().then([this]() {
						return deliver_loop();
					});
				ev = std::move(evs.front());
				/* One event per block.  */
				cursor = ev.block_number + 1;
			}

			return deliver(std::move(ev)).then([this]() {
				return deliver_loop();
			});
		});
	}

	Ev::Io<void> deliver(Htlc::Event ev) {
		auto block = ev.block_number;
		return on_event(Chain::EscrowEvent{cfg.name, std::move(ev)})
			.catching<std::exception>([this, block](std::exception const& e) {
			return Xswap::log( bus, Xswap::Error
					 , "%s: handler failed on event at block %llu: %s"
					 , cfg.name.c_str()
					 , (unsigned long long) block
					 , e.what()
					 );
		});
	}

	Ev::Io<void> confirm_loop(std::uint64_t target) {
		return Ev::lift().then([this, target]() -> Ev::Io<void> {
			if (closed)
				throw TransientError(cfg.name + ": adapter closed");
			if (reachable && chain.ledger().head() >= target)
				return Ev::lift();
			return chain.wait_change().then([this, target]() {
				return confirm_loop(target);
			});
		});
	}

public:
	Impl( S::Bus& bus_
	    , Xswap::Mod::Waiter& waiter_
	    , LocalChain& chain_
	    , Config cfg_
	    , RetryPolicy retry_
	    ) : bus(bus_)
	      , waiter(waiter_)
	      , chain(chain_)
	      , cfg(std::move(cfg_))
	      , retry(retry_)
	      , reachable(true)
	      , closed(false)
	      , refusing(false)
	      , failures_pending(0)
	      , subscribed(false)
	      , cursor(0)
	      { }

	Config const& config() const { return cfg; }

	Ev::Io<void>
	subscribe( std::uint64_t from_block
		 , std::function<Ev::Io<void>(Chain::EscrowEvent)> cb
		 ) {
		return Ev::lift().then([this, from_block, cb]() {
			check_available();
			if (subscribed)
				throw TransientError(cfg.name + ": already subscribed");
			subscribed = true;
			cursor = from_block;
			on_event = cb;
			return Xswap::log( bus, Xswap::Info
					 , "%s: subscribed from block %llu"
					 , cfg.name.c_str()
					 , (unsigned long long) from_block
					 );
		}).then([this]() {
			return Xswap::concurrent(deliver_loop());
		});
	}

	Ev::Io<TxHandle> submit(std::string what, std::function<Htlc::Receipt()> op) {
		return submit(std::move(what), std::move(op), 1, retry.initial_backoff);
	}

	Ev::Io<void> wait_confirmed(TxHandle handle, std::uint64_t confirmations) {
		if (confirmations == 0)
			confirmations = 1;
		auto target = handle.block_number + confirmations - 1;
		return waiter.timed(retry.confirm_timeout, confirm_loop(target))
			.catching<Xswap::Mod::Waiter::TimedOut>([this, handle](Xswap::Mod::Waiter::TimedOut const& _) -> Ev::Io<void> {
			throw TransientError( cfg.name
					    + ": confirmation timed out for "
					    + std::string(handle.tx_hash)
					    );
		});
	}

	Ev::Io<std::uint64_t> current_rate(std::string order_id) {
		return Ev::lift().then([this, order_id]() {
			check_available();
			try {
				return Ev::lift(chain.ledger().current_rate(
					order_id, chain.now(), false
				));
			} catch (Htlc::Error const& e) {
				throw RevertedError(e.code(), e.what());
			}
		});
	}
	Ev::Io<std::uint64_t> head() {
		return Ev::lift().then([this]() {
			check_available();
			return Ev::lift(chain.ledger().head());
		});
	}
	Ev::Io<bool> is_healthy() {
		return Ev::lift().then([this]() {
			return Ev::lift( !closed && reachable
				      && chain.ledger().chain_id() == cfg.chain_id
				       );
		});
	}
	Ev::Io<void> refuse_submissions() {
		return Ev::lift().then([this]() {
			if (refusing)
				return Ev::lift();
			refusing = true;
			return Xswap::log( bus, Xswap::Debug
					 , "%s: refusing further submissions"
					 , cfg.name.c_str()
					 );
		});
	}
	Ev::Io<void> close() {
		return Ev::lift().then([this]() {
			if (closed)
				return Ev::lift();
			closed = true;
			/* Wake the delivery loop so it can exit.  */
			chain.notify();
			return Xswap::log( bus, Xswap::Info
					 , "%s: adapter closed"
					 , cfg.name.c_str()
					 );
		});
	}

	LocalChain& local() { return chain; }

	void set_reachable(bool flag) {
		reachable = flag;
		chain.notify();
	}
	void fail_next(std::size_t n) {
		failures_pending = n;
	}
	void inject(Htlc::Event ev) {
		injected.push_back(std::move(ev));
		chain.notify();
	}
};

LocalAdapter::LocalAdapter( S::Bus& bus
			  , Xswap::Mod::Waiter& waiter
			  , LocalChain& chain
			  , Config config
			  , RetryPolicy retry
			  ) : pimpl(Util::make_unique<Impl>( bus, waiter, chain
							   , std::move(config)
							   , retry
							   ))
			    { }
LocalAdapter::~LocalAdapter() { }

Chain::Config const& LocalAdapter::config() const {
	return pimpl->config();
}

Ev::Io<void>
LocalAdapter::subscribe( std::uint64_t from_block
		       , std::function<Ev::Io<void>(Chain::EscrowEvent)> on_event
		       ) {
	return pimpl->subscribe(from_block, std::move(on_event));
}

Ev::Io<TxHandle> LocalAdapter::submit_lock(Htlc::LockArgs args) {
	auto& chain = pimpl->local();
	auto caller = config().account;
	return pimpl->submit("lock", [&chain, caller, args]() {
		return chain.lock(caller, args);
	});
}
Ev::Io<TxHandle>
LocalAdapter::submit_lock_as_resolver(Htlc::ResolverLockArgs args) {
	auto& chain = pimpl->local();
	auto caller = config().account;
	return pimpl->submit("lock_as_resolver", [&chain, caller, args]() {
		return chain.lock_as_resolver(caller, args);
	});
}
Ev::Io<TxHandle>
LocalAdapter::submit_withdraw( Sha256::Hash escrow_id
			     , std::string secret
			     ) {
	auto& chain = pimpl->local();
	auto caller = config().account;
	return pimpl->submit("withdraw", [&chain, caller, escrow_id, secret]() {
		return chain.withdraw(caller, escrow_id, secret);
	});
}
Ev::Io<TxHandle> LocalAdapter::submit_cancel(Sha256::Hash escrow_id) {
	auto& chain = pimpl->local();
	auto caller = config().account;
	return pimpl->submit("cancel", [&chain, caller, escrow_id]() {
		return chain.cancel(caller, escrow_id);
	});
}

Ev::Io<void> LocalAdapter::wait_confirmed( TxHandle handle
					 , std::uint64_t confirmations
					 ) {
	return pimpl->wait_confirmed(std::move(handle), confirmations);
}
Ev::Io<std::uint64_t> LocalAdapter::current_rate(std::string order_id) {
	return pimpl->current_rate(std::move(order_id));
}
Ev::Io<std::uint64_t> LocalAdapter::head() {
	return pimpl->head();
}
Ev::Io<bool> LocalAdapter::is_healthy() {
	return pimpl->is_healthy();
}
Ev::Io<void> LocalAdapter::refuse_submissions() {
	return pimpl->refuse_submissions();
}
Ev::Io<void> LocalAdapter::close() {
	return pimpl->close();
}

void LocalAdapter::set_reachable(bool flag) {
	pimpl->set_reachable(flag);
}
void LocalAdapter::fail_next(std::size_t n) {
	pimpl->fail_next(n);
}
void LocalAdapter::inject(Htlc::Event event) {
	pimpl->inject(std::move(event));
}

}
