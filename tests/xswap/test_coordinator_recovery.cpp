#undef NDEBUG
#include"Ev/start.hpp"
#include"Xswap/Shutdown.hpp"
#include"Fixture.hpp"

namespace {

std::size_t count_errors(Fixture const& f, std::string const& fragment) {
	auto n = std::size_t(0);
	for (auto const& e : f.coordinator.errors().all())
		if (e.message.find(fragment) != std::string::npos)
			++n;
	return n;
}

}

int main() {
	Fixture f;
	auto src1 = Sha256::Hash();
	auto dst1 = Sha256::Hash();
	auto src2 = Sha256::Hash();
	auto dst2 = Sha256::Hash();

	auto code = Ev::lift().then([&]() {
		f.coordinator.register_order(f.order("o1"));
		return f.coordinator.start();
	}).then([&]() {
		src1 = f.maker_lock("o1").escrow_id;
		dst1 = f.resolver_lock("o1", src1).escrow_id;
		return until([&]() {
			auto s = f.coordinator.get_swap("o1");
			return s && s->status == Xswap::CrossChainSwap::DestLocked;
		});
	}).then([&]() {
		/* Before the deadline nothing happens.  */
		f.now += 3599;
		return f.coordinator.scan_recovery();
	}).then([&]() {
		return f.coordinator.idle();
	}).then([&]() {
		assert(f.swap_status("o1") == Xswap::CrossChainSwap::DestLocked);

		/* The maker never claimed our leg: take it
		 * back.  */
		f.now += 1;
		return f.coordinator.scan_recovery();
	}).then([&]() {
		return until([&]() {
			return f.swap_status("o1") == Xswap::CrossChainSwap::Failed;
		});
	}).then([&]() {
		assert(f.order_status("o1") == Xswap::Order::Expired);
		assert(f.has_error("execution deadline passed"));
		assert(f.dst_chain.ledger().get(dst1)->cancelled);
		assert(f.dst_chain.ledger().balance("relayer", "USDT") == 1000);

		auto s = f.coordinator.get_swap("o1");
		assert(s->dest.state == Xswap::Leg::Cancelled);
		/* Not ours to cancel.  */
		assert(s->source.state == Xswap::Leg::Locked);

		auto st = f.coordinator.get_state();
		assert(st.metrics.failed_orders == 1);
		assert(st.metrics.cancelled_orders == 0);

		/* Only the maker can refund the source, once its
		 * timelock passes; tell them once.  */
		f.now = 10000 + 7200;
		return f.coordinator.scan_recovery();
	}).then([&]() {
		return f.coordinator.idle();
	}).then([&]() {
		return f.coordinator.scan_recovery();
	}).then([&]() {
		return f.coordinator.idle();
	}).then([&]() {
		assert(count_errors(f, "may now cancel") == 1);
		assert(!f.src_chain.ledger().get(src1)->terminal());

		/* A withdrawal that cannot get through is
		 * retried by the scan.  */
		f.coordinator.register_order(f.order("o2"));
		src2 = f.maker_lock("o2").escrow_id;
		dst2 = f.resolver_lock("o2", src2).escrow_id;
		return until([&]() {
			auto s = f.coordinator.get_swap("o2");
			return s && s->status == Xswap::CrossChainSwap::DestLocked;
		});
	}).then([&]() {
		f.src.fail_next(2);
		f.dst_chain.withdraw("maker", dst2, f.secret);
		return until([&]() {
			return f.has_error("withdrawal delayed");
		});
	}).then([&]() {
		return f.coordinator.idle();
	}).then([&]() {
		assert(f.swap_status("o2") == Xswap::CrossChainSwap::SecretRevealed);
		assert(f.order_status("o2") == Xswap::Order::Executing);
		assert(!f.src_chain.ledger().get(src2)->withdrawn);

		/* Holding the secret keeps it out of recovery,
		 * even past its deadline.  */
		f.now += 3600;
		return f.coordinator.scan_recovery();
	}).then([&]() {
		return until([&]() {
			return f.swap_status("o2") == Xswap::CrossChainSwap::Completed;
		});
	}).then([&]() {
		assert(f.order_status("o2") == Xswap::Order::Completed);
		assert(f.src_chain.ledger().get(src2)->withdrawn);
		assert(f.completed.size() == 1);
		assert(!f.dst_chain.ledger().get(dst2)->cancelled);
		return f.coordinator.stop();
	}).then([&]() {
		return f.bus.raise(Xswap::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
