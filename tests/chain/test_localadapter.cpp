#undef NDEBUG
#include"Chain/Error.hpp"
#include"Chain/LocalAdapter.hpp"
#include"Chain/LocalChain.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Sha256/fun.hpp"
#include"Xswap/Mod/Waiter.hpp"
#include"Xswap/Shutdown.hpp"
#include<assert.h>
#include<vector>

namespace {

Ev::Io<void> until(std::function<bool()> pred, std::size_t tries = 1000) {
	return Ev::yield().then([pred, tries]() {
		if (pred())
			return Ev::lift();
		assert(tries > 0);
		return until(pred, tries - 1);
	});
}

Htlc::LockArgs lock_args(std::string const& order_id, std::string const& receiver) {
	auto a = Htlc::LockArgs();
	a.secret_hash = Sha256::fun(std::string("s"));
	a.timelock_seconds = 3600;
	a.receiver = receiver;
	a.resolver = receiver;
	a.order_id = order_id;
	a.auction_duration = 60;
	a.start_rate = 1000000;
	a.end_rate = 990000;
	a.amount = 10;
	a.asset = "USDC";
	return a;
}

}

int main() {
	auto bus = S::Bus();
	Xswap::Mod::Waiter waiter(bus);
	auto now = std::uint64_t(1000);
	Chain::LocalChain chain(7, "owner", [&now]() { return now; });

	auto cfg = Chain::Config();
	cfg.name = "alpha";
	cfg.chain_id = 7;
	cfg.confirmations = 2;
	cfg.block_time = 0;
	cfg.endpoint = "local";
	cfg.account = "relayer";
	auto retry = Chain::RetryPolicy();
	retry.max_attempts = 3;
	retry.initial_backoff = 0.01;
	retry.max_backoff = 0.02;
	Chain::LocalAdapter adapter(bus, waiter, chain, cfg, retry);

	chain.deposit("maker", "USDC", 100);
	chain.deposit("relayer", "USDC", 100);

	auto events = std::vector<Chain::EscrowEvent>();
	auto handle = Chain::TxHandle();
	auto confirmed = false;

	auto code = Ev::lift().then([&]() {
		assert(adapter.name() == "alpha");
		assert(adapter.account() == "relayer");

		/* Events already on the ledger are replayed.  */
		chain.lock("maker", lock_args("o1", "relayer"));
		return adapter.subscribe(0, [&](Chain::EscrowEvent ev) {
			events.push_back(std::move(ev));
			return Ev::lift();
		});
	}).then([&]() {
		return until([&]() { return events.size() == 1; });
	}).then([&]() {
		assert(events[0].chain == "alpha");
		assert(events[0].event.type == Htlc::Event::Created);
		assert(events[0].event.order_id == "o1");

		/* A second subscription is refused.  */
		return adapter.subscribe(0, [](Chain::EscrowEvent) {
			return Ev::lift();
		}).then([]() {
			assert(false);
			return Ev::lift(false);
		}).catching<Chain::TransientError>([](Chain::TransientError const&) {
			return Ev::lift(true);
		});
	}).then([&](bool refused) {
		assert(refused);

		return adapter.submit_lock(lock_args("o2", "maker"));
	}).then([&](Chain::TxHandle h) {
		assert(h.chain == "alpha");
		assert(h.block_number == 2);
		assert(chain.ledger().get(h.escrow_id)->sender == "relayer");
		handle = h;

		/* Two confirmations need one more block.  */
		return Ev::concurrent(adapter.wait_confirmed(handle, 2).then([&]() {
			confirmed = true;
			return Ev::lift();
		}));
	}).then([&]() {
		return Ev::yield(10);
	}).then([&]() {
		assert(!confirmed);
		chain.mine(1);
		return until([&]() { return confirmed; });
	}).then([&]() {
		return until([&]() { return events.size() == 2; });
	}).then([&]() {
		/* Rejections come back as reverts, with the
		 * ledger's code.  */
		return adapter.submit_cancel(handle.escrow_id).then([](Chain::TxHandle) {
			assert(false);
			return Ev::lift(Htlc::NotFound);
		}).catching<Chain::RevertedError>([](Chain::RevertedError const& e) {
			return Ev::lift(e.code());
		});
	}).then([&](Htlc::ErrorCode c) {
		assert(c == Htlc::TimelockNotExpired);

		/* Transient failures are retried.  */
		adapter.fail_next(2);
		now = 1000 + 3600;
		return adapter.submit_cancel(handle.escrow_id);
	}).then([&](Chain::TxHandle h) {
		assert(chain.ledger().get(handle.escrow_id)->cancelled);

		/* ...but not forever.  */
		adapter.fail_next(3);
		return adapter.submit_lock(lock_args("o3", "maker")).then([](Chain::TxHandle) {
			assert(false);
			return Ev::lift(false);
		}).catching<Chain::TransientError>([](Chain::TransientError const&) {
			return Ev::lift(true);
		});
	}).then([&](bool gave_up) {
		assert(gave_up);
		assert(!chain.ledger().find_by_order("o3"));

		return adapter.current_rate("o1");
	}).then([&](std::uint64_t rate) {
		/* The auction of o1 is over.  */
		assert(rate == 990000);
		return adapter.head();
	}).then([&](std::uint64_t h) {
		assert(h == chain.ledger().head());
		return until([&]() { return events.size() == 3; });
	}).then([&]() {
		/* Delivery pauses while unreachable.  */
		adapter.set_reachable(false);
		return adapter.is_healthy();
	}).then([&](bool healthy) {
		assert(!healthy);
		chain.lock("maker", lock_args("o4", "relayer"));
		return Ev::yield(20);
	}).then([&]() {
		assert(events.size() == 3);
		return adapter.head().then([](std::uint64_t) {
			assert(false);
			return Ev::lift(false);
		}).catching<Chain::TransientError>([](Chain::TransientError const&) {
			return Ev::lift(true);
		});
	}).then([&](bool failed) {
		assert(failed);

		/* Injected events come first, then the ledger
		 * resumes where it left off.  */
		auto ev = Htlc::Event();
		ev.type = Htlc::Event::Unknown;
		ev.type_name = "Upgraded";
		adapter.inject(ev);
		adapter.set_reachable(true);
		return until([&]() { return events.size() == 5; });
	}).then([&]() {
		assert(events[3].event.type == Htlc::Event::Unknown);
		assert(events[3].event.type_name == "Upgraded");
		assert(events[4].event.order_id == "o4");
		return adapter.is_healthy();
	}).then([&](bool healthy) {
		assert(healthy);
		return adapter.close();
	}).then([&]() {
		return adapter.is_healthy();
	}).then([&](bool healthy) {
		assert(!healthy);
		return adapter.submit_lock(lock_args("o5", "maker")).then([](Chain::TxHandle) {
			assert(false);
			return Ev::lift(false);
		}).catching<Chain::TransientError>([](Chain::TransientError const&) {
			return Ev::lift(true);
		});
	}).then([&](bool failed) {
		assert(failed);
		return bus.raise(Xswap::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
