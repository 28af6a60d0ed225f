#ifndef TESTS_XSWAP_FIXTURE_HPP
#define TESTS_XSWAP_FIXTURE_HPP

#include"Chain/LocalAdapter.hpp"
#include"Chain/LocalChain.hpp"
#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Sha256/fun.hpp"
#include"Sqlite3.hpp"
#include"Xswap/Mod/CheckpointStore.hpp"
#include"Xswap/Mod/SwapCoordinator.hpp"
#include"Xswap/Mod/Waiter.hpp"
#include"Xswap/Msg/SwapCompleted.hpp"
#include<assert.h>
#include<functional>
#include<string>
#include<vector>

/* Two local chains, "src" and "dst", both watched by a
 * coordinator acting as "relayer", and a "maker" who
 * swaps USDC on src for USDT on dst.  */
class Fixture {
private:
	static Chain::Config config(std::string name, std::uint64_t id) {
		auto c = Chain::Config();
		c.name = std::move(name);
		c.chain_id = id;
		c.confirmations = 1;
		c.block_time = 0;
		c.endpoint = "local";
		c.account = "relayer";
		return c;
	}
	static Chain::RetryPolicy retry() {
		auto r = Chain::RetryPolicy();
		r.max_attempts = 2;
		r.initial_backoff = 0.01;
		r.max_backoff = 0.02;
		r.confirm_timeout = 5;
		return r;
	}
	Xswap::Mod::SwapCoordinator::Settings settings() {
		auto s = Xswap::Mod::SwapCoordinator::Settings();
		s.drain_timeout = 1;
		s.health_timeout = 1;
		s.clock = [this]() { return now; };
		return s;
	}
	std::vector<Chain::LedgerAdapter*> adapters() {
		auto v = std::vector<Chain::LedgerAdapter*>();
		v.push_back(&src);
		v.push_back(&dst);
		return v;
	}

public:
	std::uint64_t now;
	S::Bus bus;
	Xswap::Mod::Waiter waiter;
	Chain::LocalChain src_chain;
	Chain::LocalChain dst_chain;
	Chain::LocalAdapter src;
	Chain::LocalAdapter dst;
	Sqlite3::Db db;
	Xswap::Mod::CheckpointStore checkpoints;
	Xswap::Mod::SwapCoordinator coordinator;

	std::vector<Xswap::Msg::SwapCompleted> completed;

	std::string const secret;
	Sha256::Hash const secret_hash;

	Fixture() : now(10000)
		  , waiter(bus)
		  , src_chain(1, "owner", [this]() { return now; })
		  , dst_chain(2, "owner", [this]() { return now; })
		  , src(bus, waiter, src_chain, config("src", 1), retry())
		  , dst(bus, waiter, dst_chain, config("dst", 2), retry())
		  , db(":memory:")
		  , checkpoints(db)
		  , coordinator(bus, waiter, checkpoints, adapters(), settings())
		  , secret("correct horse battery staple")
		  , secret_hash(Sha256::fun(secret))
		  {
		src_chain.deposit("maker", "USDC", 1000);
		dst_chain.deposit("relayer", "USDT", 1000);
		dst_chain.set_resolver("relayer", true);
		bus.subscribe<Xswap::Msg::SwapCompleted
			     >([this](Xswap::Msg::SwapCompleted const& m) {
			completed.push_back(m);
			return Ev::lift();
		});
	}

	Xswap::Order order(std::string const& order_id) const {
		auto o = Xswap::Order();
		o.order_id = order_id;
		o.maker = "maker";
		o.receiver = "maker";
		o.src_chain = "src";
		o.dest_chain = "dst";
		o.src_asset = "USDC";
		o.dest_asset = "USDT";
		o.src_amount = 100;
		o.dest_amount = 99;
		o.secret_hash = secret_hash;
		return o;
	}

	/* The maker's lock on src; times out after 2 hours.  */
	Htlc::Receipt maker_lock(std::string const& order_id) {
		auto a = Htlc::LockArgs();
		a.secret_hash = secret_hash;
		a.timelock_seconds = 7200;
		a.receiver = "relayer";
		a.resolver = "relayer";
		a.order_id = order_id;
		a.auction_duration = 100;
		a.start_rate = 1000000;
		a.end_rate = 990000;
		a.amount = 100;
		a.asset = "USDC";
		return src_chain.lock("maker", a);
	}
	/* Our counter lock on dst; times out after 1 hour.  */
	Htlc::Receipt resolver_lock( std::string const& order_id
				   , Sha256::Hash const& source
				   ) {
		auto a = Htlc::ResolverLockArgs();
		a.secret_hash = secret_hash;
		a.timelock_seconds = 3600;
		a.receiver = "maker";
		a.order_id = order_id;
		a.source_escrow_id = source;
		a.amount = 99;
		a.asset = "USDT";
		a.auction_start = 0;
		a.auction_end = 0;
		a.start_rate = 0;
		a.end_rate = 0;
		return dst_chain.lock_as_resolver("relayer", a);
	}

	Xswap::CrossChainSwap::Status swap_status(std::string const& order_id) const {
		auto s = coordinator.get_swap(order_id);
		assert(s);
		return s->status;
	}
	Xswap::Order::Status order_status(std::string const& order_id) const {
		auto o = coordinator.get_order(order_id);
		assert(o);
		return o->status;
	}
	bool has_error(std::string const& fragment) const {
		for (auto const& e : coordinator.errors().all())
			if (e.message.find(fragment) != std::string::npos)
				return true;
		return false;
	}
};

/* Lets the greenthreads run until `pred` holds.  */
inline
Ev::Io<void> until(std::function<bool()> pred, std::size_t tries = 2000) {
	return Ev::yield().then([pred, tries]() {
		if (pred())
			return Ev::lift();
		assert(tries > 0);
		return until(pred, tries - 1);
	});
}

#endif /* !defined(TESTS_XSWAP_FIXTURE_HPP) */
