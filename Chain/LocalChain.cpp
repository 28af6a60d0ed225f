#include"Chain/LocalChain.hpp"
#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Util/make_unique.hpp"
#include<vector>

namespace Chain {

class LocalChain::Impl {
public:
	Htlc::Ledger ledger;
	std::function<std::uint64_t()> clock;
	std::vector<std::function<void()>> waiters;

	Impl( std::uint64_t chain_id
	    , std::string owner
	    , std::function<std::uint64_t()> clock_
	    , Htlc::Params params
	    ) : ledger(chain_id, std::move(owner), params)
	      , clock(std::move(clock_))
	      { }

	Htlc::Context context(std::string const& caller) const {
		return Htlc::Context{caller, clock()};
	}
};

LocalChain::LocalChain( std::uint64_t chain_id
		      , std::string owner
		      , std::function<std::uint64_t()> clock
		      , Htlc::Params params
		      ) : pimpl(Util::make_unique<Impl>( chain_id
						       , std::move(owner)
						       , std::move(clock)
						       , params
						       ))
			{ }
LocalChain::~LocalChain() { }

Htlc::Ledger const& LocalChain::ledger() const {
	return pimpl->ledger;
}
std::uint64_t LocalChain::now() const {
	return pimpl->clock();
}

Htlc::Receipt
LocalChain::lock(std::string const& caller, Htlc::LockArgs const& args) {
	auto r = pimpl->ledger.lock(pimpl->context(caller), args);
	notify();
	return r;
}
Htlc::Receipt
LocalChain::lock_as_resolver( std::string const& caller
			    , Htlc::ResolverLockArgs const& args
			    ) {
	auto r = pimpl->ledger.lock_as_resolver(pimpl->context(caller), args);
	notify();
	return r;
}
Htlc::Receipt
LocalChain::withdraw( std::string const& caller
		    , Sha256::Hash const& escrow_id
		    , std::string const& secret
		    ) {
	auto r = pimpl->ledger.withdraw( pimpl->context(caller)
				       , escrow_id, secret
				       );
	notify();
	return r;
}
Htlc::Receipt
LocalChain::cancel( std::string const& caller
		  , Sha256::Hash const& escrow_id
		  ) {
	auto r = pimpl->ledger.cancel(pimpl->context(caller), escrow_id);
	notify();
	return r;
}

void LocalChain::set_resolver(std::string const& resolver, bool authorized) {
	auto& l = pimpl->ledger;
	l.set_resolver(pimpl->context(l.owner()), resolver, authorized);
}
void LocalChain::deposit( std::string const& account
			, std::string const& asset
			, std::uint64_t amount
			) {
	auto& l = pimpl->ledger;
	l.deposit(pimpl->context(l.owner()), account, asset, amount);
}

void LocalChain::mine(std::uint64_t blocks) {
	if (blocks == 0)
		return;
	pimpl->ledger.advance(blocks);
	notify();
}

Ev::Io<void> LocalChain::wait_change() {
	return Ev::Io<void>([this]( std::function<void()> pass
				  , std::function<void(std::exception_ptr)> fail
				  ) {
		pimpl->waiters.push_back(std::move(pass));
	});
}
void LocalChain::notify() {
	auto waiters = std::move(pimpl->waiters);
	pimpl->waiters.clear();
	for (auto& pass : waiters) {
		/* Resume on a later loop iteration, never
		 * inside the transaction that notified.
		 * Ev::yield cannot fail.  */
		Ev::yield().run(pass, [](std::exception_ptr) { });
	}
}

}
