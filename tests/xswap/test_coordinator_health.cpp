#undef NDEBUG
#include"Chain/Error.hpp"
#include"Ev/start.hpp"
#include"Xswap/Msg/Log.hpp"
#include"Xswap/Shutdown.hpp"
#include"Fixture.hpp"
#include<algorithm>

namespace {

bool connected(Fixture const& f, std::string const& chain) {
	auto cs = f.coordinator.get_state().connected_chains;
	return std::find(cs.begin(), cs.end(), chain) != cs.end();
}

}

int main() {
	Fixture f;
	auto src1 = Sha256::Hash();
	auto backing_off = false;
	f.bus.subscribe<Xswap::Msg::Log>([&](Xswap::Msg::Log const& l) {
		if (l.message.find("retrying in") != std::string::npos)
			backing_off = true;
		return Ev::lift();
	});

	auto code = Ev::lift().then([&]() {
		return f.coordinator.start();
	}).then([&]() {
		assert(f.coordinator.get_state().running);
		assert(connected(f, "src"));
		assert(connected(f, "dst"));
		return f.coordinator.check_health();
	}).then([&]() {
		assert(!f.has_error("health check failed"));

		f.dst.set_reachable(false);
		return f.coordinator.check_health();
	}).then([&]() {
		assert(connected(f, "src"));
		assert(!connected(f, "dst"));
		auto all = f.coordinator.errors().all();
		assert(!all.empty());
		auto const& last = all.back();
		assert(last.message == "health check failed");
		assert(last.chain == "dst");
		assert(last.level == Xswap::ErrorRecord::Warning);

		f.dst.set_reachable(true);
		return f.coordinator.check_health();
	}).then([&]() {
		assert(connected(f, "src"));
		assert(connected(f, "dst"));

		f.coordinator.register_order(f.order("o1"));
		src1 = f.maker_lock("o1").escrow_id;
		f.resolver_lock("o1", src1);
		return until([&]() {
			auto s = f.coordinator.get_swap("o1");
			return s && s->status == Xswap::CrossChainSwap::DestLocked;
		});
	}).then([&]() {
		/* Our withdrawal on src is waiting out a
		 * backoff when the stop begins.  */
		f.src.fail_next(1);
		auto dst1 = f.coordinator.get_swap("o1")->dest.escrow_id;
		f.dst_chain.withdraw("maker", dst1, f.secret);
		return until([&]() { return backing_off; });
	}).then([&]() {
		assert(!f.src_chain.ledger().get(src1)->withdrawn);

		/* Once stopped, the ledgers are no longer
		 * followed.  */
		return f.coordinator.stop();
	}).then([&]() {
		/* The retry was refused, not submitted.  */
		assert(!f.src_chain.ledger().get(src1)->withdrawn);
		assert(f.has_error("submissions refused"));
		assert(f.swap_status("o1") == Xswap::CrossChainSwap::SecretRevealed);
		return f.src.submit_cancel(src1).then([](Chain::TxHandle) {
			return Ev::lift(false);
		}).catching<Chain::TransientError>([](Chain::TransientError const&) {
			return Ev::lift(true);
		});
	}).then([&](bool refused) {
		assert(refused);
		assert(!f.coordinator.get_state().running);
		return f.src.is_healthy();
	}).then([&](bool healthy) {
		assert(!healthy);
		f.maker_lock("late");
		return Ev::yield(50);
	}).then([&]() {
		return f.coordinator.idle();
	}).then([&]() {
		assert(!f.coordinator.get_swap("late"));
		assert(!f.coordinator.get_order("late"));

		/* Stopping twice is harmless.  */
		return f.coordinator.stop();
	}).then([&]() {
		return f.bus.raise(Xswap::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
