#undef NDEBUG
#include"Ev/start.hpp"
#include"Xswap/Shutdown.hpp"
#include"Fixture.hpp"

int main() {
	Fixture f;
	auto src = Sha256::Hash();
	auto dst = Sha256::Hash();
	auto errors_before = std::size_t(0);

	auto code = Ev::lift().then([&]() {
		f.coordinator.register_order(f.order("o1"));
		return f.coordinator.start();
	}).then([&]() {
		src = f.maker_lock("o1").escrow_id;
		dst = f.resolver_lock("o1", src).escrow_id;
		return until([&]() {
			auto s = f.coordinator.get_swap("o1");
			return s && s->status == Xswap::CrossChainSwap::DestLocked;
		});
	}).then([&]() {
		errors_before = f.coordinator.errors().all().size();

		/* Kinds of event we cannot decode are skipped.  */
		auto u = Htlc::Event();
		u.type = Htlc::Event::Unknown;
		u.type_name = "EscrowRebalanced";
		u.order_id = "o1";
		f.dst.inject(u);
		return Ev::yield(20);
	}).then([&]() {
		return f.coordinator.idle();
	}).then([&]() {
		assert(f.swap_status("o1") == Xswap::CrossChainSwap::DestLocked);
		assert(f.coordinator.errors().all().size() == errors_before);

		/* A withdrawal whose secret does not hash to
		 * the order's.  */
		auto w = Htlc::Event();
		w.type = Htlc::Event::Withdrawn;
		w.escrow_id = dst;
		w.order_id = "o1";
		w.sender = "relayer";
		w.receiver = "maker";
		w.amount = 99;
		w.asset = "USDT";
		w.secret_hash = f.secret_hash;
		w.secret = "not the secret";
		w.execution_rate = 1000000;
		f.dst.inject(w);
		return until([&]() {
			return f.swap_status("o1") == Xswap::CrossChainSwap::Failed;
		});
	}).then([&]() {
		assert(f.order_status("o1") == Xswap::Order::Failed);
		assert(f.has_error("does not match"));
		auto st = f.coordinator.get_state();
		assert(st.metrics.failed_orders == 1);
		assert(st.metrics.successful_orders == 0);
		assert(st.pending_swaps.empty());
		auto s = f.coordinator.get_swap("o1");
		assert(!s->has_secret);
		/* Nothing was withdrawn with it.  */
		assert(!f.src_chain.ledger().get(src)->terminal());
		assert(f.completed.empty());

		/* An escrow for an order nobody registered is
		 * still tracked, from what the ledger says.  */
		f.maker_lock("o9");
		return until([&]() {
			return !!f.coordinator.get_swap("o9");
		});
	}).then([&]() {
		auto o = f.coordinator.get_order("o9");
		assert(o);
		assert(o->maker == "maker");
		assert(o->src_chain == "src");
		assert(o->src_asset == "USDC");
		assert(o->src_amount == 100);
		assert(o->status == Xswap::Order::AuctionActive);
		assert(f.swap_status("o9") == Xswap::CrossChainSwap::SourceLocked);
		assert(f.coordinator.get_state().metrics.total_orders == 2);

		/* Escrows without an order id are reported.  */
		auto c = Htlc::Event();
		c.type = Htlc::Event::Created;
		c.escrow_id = Sha256::fun(std::string("stray"));
		c.sender = "someone";
		c.receiver = "relayer";
		c.amount = 5;
		c.asset = "USDC";
		f.src.inject(c);
		return until([&]() {
			return f.has_error("without an order id");
		});
	}).then([&]() {
		return f.coordinator.stop();
	}).then([&]() {
		return f.bus.raise(Xswap::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
