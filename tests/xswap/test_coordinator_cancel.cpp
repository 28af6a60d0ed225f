#undef NDEBUG
#include"Ev/start.hpp"
#include"Xswap/Mod/FeedWriter.hpp"
#include"Xswap/Mod/JsonOutputter.hpp"
#include"Xswap/Shutdown.hpp"
#include"Fixture.hpp"
#include<sstream>

/* Nobody takes the order, and the maker takes the
 * funds back once the timelock passes.  */
int main() {
	Fixture f;
	auto feed_out = std::ostringstream();
	Xswap::Mod::JsonOutputter outputter(feed_out, f.bus);
	Xswap::Mod::FeedWriter feed(f.bus);
	auto src_escrow = Sha256::Hash();

	auto code = Ev::lift().then([&]() {
		f.coordinator.register_order(f.order("o1"));
		return f.coordinator.start();
	}).then([&]() {
		src_escrow = f.maker_lock("o1").escrow_id;
		return until([&]() {
			auto s = f.coordinator.get_swap("o1");
			return s && s->status == Xswap::CrossChainSwap::SourceLocked;
		});
	}).then([&]() {
		/* An open swap holds the checkpoint at the
		 * block its escrow was created in.  */
		f.src_chain.mine(5);
		return Ev::yield(10);
	}).then([&]() {
		assert(f.coordinator.checkpoint("src") == 1);

		f.now += 7200;
		f.src_chain.cancel("maker", src_escrow);
		return until([&]() {
			return f.swap_status("o1") == Xswap::CrossChainSwap::Failed;
		});
	}).then([&]() {
		assert(f.order_status("o1") == Xswap::Order::Cancelled);
		auto s = f.coordinator.get_swap("o1");
		assert(s->source.state == Xswap::Leg::Cancelled);
		assert(!s->has_secret);
		assert(f.src_chain.ledger().balance("maker", "USDC") == 1000);

		auto st = f.coordinator.get_state();
		assert(st.metrics.cancelled_orders == 1);
		assert(st.metrics.failed_orders == 0);
		assert(st.metrics.successful_orders == 0);
		assert(st.pending_swaps.empty());
		assert(st.active_orders.empty());
		assert(f.has_error("order cancelled"));
		assert(f.completed.empty());

		/* Nothing is left to watch.  */
		assert(f.coordinator.checkpoint("src") == 8);

		/* A refund after a terminal state changes
		 * nothing.  */
		return f.coordinator.scan_recovery();
	}).then([&]() {
		return f.coordinator.idle();
	}).then([&]() {
		assert(f.order_status("o1") == Xswap::Order::Cancelled);
		return f.coordinator.stop();
	}).then([&]() {
		return Ev::yield(10);
	}).then([&]() {
		/* The refund names who got the funds back.  */
		auto out = feed_out.str();
		assert(out.find("\"sender\": \"maker\", \"refundAmount\": 100") != std::string::npos);
		return f.bus.raise(Xswap::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
