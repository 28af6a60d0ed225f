#ifndef CHAIN_LOCALCHAIN_HPP
#define CHAIN_LOCALCHAIN_HPP

#include"Htlc/Ledger.hpp"
#include<cstdint>
#include<functional>
#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }

namespace Chain {

/** class Chain::LocalChain
 *
 * @brief an in-process chain: one `Htlc::Ledger`, a
 * clock, and change notification.
 *
 * @desc Every transaction goes into its own block.
 * Mutations go through this class so that adapters
 * waiting on the chain are woken up.
 * Reads can go directly to `ledger()`.
 */
class LocalChain {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	LocalChain() =delete;
	LocalChain(LocalChain const&) =delete;
	LocalChain(LocalChain&&) =delete;
	~LocalChain();

	LocalChain( std::uint64_t chain_id
		  , std::string owner
		  , std::function<std::uint64_t()> clock
		  , Htlc::Params params = Htlc::Params()
		  );

	Htlc::Ledger const& ledger() const;
	std::uint64_t now() const;

	/* Transactions, executed as `caller` at `now()`.
	 * Throw `Htlc::Error` subclasses on rejection.  */
	Htlc::Receipt lock(std::string const& caller, Htlc::LockArgs const&);
	Htlc::Receipt lock_as_resolver( std::string const& caller
				      , Htlc::ResolverLockArgs const&
				      );
	Htlc::Receipt withdraw( std::string const& caller
			      , Sha256::Hash const& escrow_id
			      , std::string const& secret
			      );
	Htlc::Receipt cancel( std::string const& caller
			    , Sha256::Hash const& escrow_id
			    );

	/* Administration, as the ledger owner.  */
	void set_resolver(std::string const& resolver, bool authorized);
	void deposit( std::string const& account
		    , std::string const& asset
		    , std::uint64_t amount
		    );

	/* Produces empty blocks.  */
	void mine(std::uint64_t blocks = 1);

	/** Chain::LocalChain::wait_change
	 *
	 * @brief suspends until the next block is
	 * produced or `notify()` is called.
	 */
	Ev::Io<void> wait_change();
	/* Wakes every greenthread in wait_change().  */
	void notify();
};

}

#endif /* !defined(CHAIN_LOCALCHAIN_HPP) */
