#include"Chain/LedgerAdapter.hpp"
#include"Chain/LocalChain.hpp"
#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"S/Bus.hpp"
#include"Sha256/fun.hpp"
#include"Util/Str.hpp"
#include"Xswap/Demo.hpp"
#include"Xswap/Mod/SwapCoordinator.hpp"
#include"Xswap/Mod/Waiter.hpp"
#include"Xswap/Msg/JsonCout.hpp"
#include"Xswap/log.hpp"
#include<memory>
#include<sodium/randombytes.h>

namespace {

auto const maker = std::string("maker");
auto const src_asset = std::string("USDC");
auto const dst_asset = std::string("USDT");
auto const src_amount = std::uint64_t(1000000);
auto const dst_amount = std::uint64_t(990000);

std::string random_hex(std::size_t bytes) {
	auto buf = std::vector<std::uint8_t>(bytes);
	randombytes_buf(&buf[0], buf.size());
	return Util::Str::hexdump(&buf[0], buf.size());
}

struct Run {
	S::Bus& bus;
	Xswap::Mod::Waiter& waiter;
	Xswap::Mod::SwapCoordinator& coordinator;
	Chain::LocalChain& src_chain;
	Chain::LedgerAdapter& src;
	Chain::LocalChain& dst_chain;
	Chain::LedgerAdapter& dst;
	double deadline;

	std::string order_id;
	std::string secret;
	Sha256::Hash src_escrow;
	Sha256::Hash dst_escrow;
};

/* Polls the coordinator until the swap reaches
 * `status`; false on deadline or failure.  */
Ev::Io<bool> reach( std::shared_ptr<Run> r
		  , Xswap::CrossChainSwap::Status status
		  ) {
	return Ev::lift().then([r, status]() {
		auto swap = r->coordinator.get_swap(r->order_id);
		if (swap && swap->status == Xswap::CrossChainSwap::Failed)
			return Ev::lift(false);
		if (swap && swap->status >= status
		 && swap->status != Xswap::CrossChainSwap::Recovering)
			return Ev::lift(true);
		if (Ev::now() >= r->deadline)
			return Ev::lift(false);
		return r->waiter.wait(0.1).then([r, status]() {
			return reach(r, status);
		});
	});
}

Ev::Io<int> give_up(std::shared_ptr<Run> r, char const* stage) {
	return Xswap::log( r->bus, Xswap::Error
			 , "Demo: order %s did not reach %s"
			 , r->order_id.c_str(), stage
			 ).then([]() {
		return Ev::lift(1);
	});
}

Ev::Io<int> finish(std::shared_ptr<Run> r) {
	auto out = Xswap::state_to_json(r->coordinator.get_state());
	return r->bus.raise(Xswap::Msg::JsonCout{out}).then([r]() {
		return Xswap::log( r->bus, Xswap::Info
				 , "Demo: order %s completed; maker holds %llu %s "
				   "on %s"
				 , r->order_id.c_str()
				 , (unsigned long long) r->dst_chain.ledger().balance(maker, dst_asset)
				 , dst_asset.c_str()
				 , r->dst.name().c_str()
				 );
	}).then([]() {
		return Ev::lift(0);
	});
}

}

namespace Xswap {

Ev::Io<int> demo( S::Bus& bus
		, Xswap::Mod::Waiter& waiter
		, Xswap::Mod::SwapCoordinator& coordinator
		, Chain::LocalChain& src_chain
		, Chain::LedgerAdapter& src
		, Chain::LocalChain& dst_chain
		, Chain::LedgerAdapter& dst
		, double timeout
		) {
	auto r = std::shared_ptr<Run>(new Run{
		bus, waiter, coordinator,
		src_chain, src, dst_chain, dst,
		Ev::now() + timeout,
		"demo-" + random_hex(4),
		random_hex(32),
		Sha256::Hash(), Sha256::Hash()
	});

	return Ev::lift().then([r]() {
		/* Fund both parties and let our account act as
		 * resolver on the destination.  */
		r->src_chain.deposit(maker, src_asset, src_amount);
		r->dst_chain.deposit(r->dst.account(), dst_asset, dst_amount);
		r->dst_chain.set_resolver(r->dst.account(), true);

		auto order = Xswap::Order();
		order.order_id = r->order_id;
		order.maker = maker;
		order.receiver = maker;
		order.src_chain = r->src.name();
		order.dest_chain = r->dst.name();
		order.src_asset = src_asset;
		order.dest_asset = dst_asset;
		order.src_amount = src_amount;
		order.dest_amount = dst_amount;
		order.secret_hash = Sha256::fun(r->secret);
		r->coordinator.register_order(order);

		auto args = Htlc::LockArgs();
		args.secret_hash = order.secret_hash;
		args.timelock_seconds = 7200;
		args.receiver = r->src.account();
		args.resolver = r->src.account();
		args.order_id = r->order_id;
		args.auction_duration = 60;
		args.start_rate = 1000000;
		args.end_rate = 990000;
		args.amount = src_amount;
		args.asset = src_asset;
		r->src_escrow = r->src_chain.lock(maker, args).escrow_id;

		return Xswap::log( r->bus, Xswap::Info
				 , "Demo: maker locked %llu %s on %s for order %s"
				 , (unsigned long long) src_amount
				 , src_asset.c_str()
				 , r->src.name().c_str()
				 , r->order_id.c_str()
				 );
	}).then([r]() {
		return reach(r, Xswap::CrossChainSwap::SourceLocked);
	}).then([r](bool ok) {
		if (!ok)
			return give_up(r, "source-locked");

		auto escrow = r->src_chain.ledger().get(r->src_escrow);
		auto args = Htlc::ResolverLockArgs();
		args.secret_hash = escrow->secret_hash;
		args.timelock_seconds = 3600;
		args.receiver = maker;
		args.order_id = r->order_id;
		args.source_escrow_id = r->src_escrow;
		args.amount = dst_amount;
		args.asset = dst_asset;
		args.auction_start = escrow->auction_start;
		args.auction_end = escrow->auction_end;
		args.start_rate = escrow->start_rate;
		args.end_rate = escrow->end_rate;
		return r->dst.submit_lock_as_resolver(args).then([r](Chain::TxHandle h) {
			r->dst_escrow = h.escrow_id;
			return reach(r, Xswap::CrossChainSwap::DestLocked);
		}).then([r](bool ok) {
			if (!ok)
				return give_up(r, "dest-locked");
			/* The maker claims the counter leg, revealing
			 * the secret to everyone.  */
			r->dst_chain.withdraw(maker, r->dst_escrow, r->secret);
			return reach(r, Xswap::CrossChainSwap::Completed).then([r](bool ok) {
				if (!ok)
					return give_up(r, "completed");
				return finish(r);
			});
		});
	});
}

}
