#ifndef HTLC_LEDGER_HPP
#define HTLC_LEDGER_HPP

#include"Htlc/Escrow.hpp"
#include"Htlc/Event.hpp"
#include"Htlc/Params.hpp"
#include"Sha256/Hash.hpp"
#include<cstdint>
#include<memory>
#include<string>
#include<vector>

namespace Htlc {

/** struct Htlc::Context
 *
 * @brief who is calling, and the ledger time the
 * call executes at.
 */
struct Context {
	std::string caller;
	std::uint64_t now;
};

/* Arguments of the sender-leg lock.  */
struct LockArgs {
	Sha256::Hash secret_hash;
	/* Relative to the lock time.  */
	std::uint64_t timelock_seconds;
	std::string receiver;
	std::string resolver;
	std::string order_id;
	std::uint64_t auction_duration;
	std::uint64_t start_rate;
	std::uint64_t end_rate;
	std::uint64_t amount;
	std::string asset;
};

/* Arguments of the counter-leg lock by a resolver.
 * The auction window is copied from the source leg so
 * both ledgers price identically; leave it all zero
 * for a counter leg without an auction.
 */
struct ResolverLockArgs {
	Sha256::Hash secret_hash;
	std::uint64_t timelock_seconds;
	std::string receiver;
	std::string order_id;
	Sha256::Hash source_escrow_id;
	std::uint64_t amount;
	std::string asset;
	std::uint64_t auction_start;
	std::uint64_t auction_end;
	std::uint64_t start_rate;
	std::uint64_t end_rate;
};

/** struct Htlc::Receipt
 *
 * @brief where an accepted transaction landed.
 */
struct Receipt {
	Sha256::Hash escrow_id;
	std::uint64_t block_number;
	Sha256::Hash tx_hash;
};

/** class Htlc::Ledger
 *
 * @brief the authoritative escrow state machine of a
 * single chain.
 *
 * @desc Each accepted transaction is applied in its
 * own block and appends one event to the log.
 * Every check of an operation runs before any state
 * is touched, so a rejected operation (thrown as a
 * subclass of `Htlc::Error`) leaves the ledger
 * exactly as it was.
 *
 * Value is accounted per (account, asset): lock
 * debits the sender, withdraw credits the receiver,
 * cancel refunds the sender.
 */
class Ledger {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Ledger() =delete;
	Ledger(Ledger const&) =delete;
	Ledger(Ledger&&);
	~Ledger();

	Ledger( std::uint64_t chain_id
	      , std::string owner
	      , Params params = Params()
	      );

	std::uint64_t chain_id() const;
	std::string const& owner() const;
	Params const& params() const;

	/** Htlc::Ledger::lock
	 *
	 * @brief creates a sender-leg escrow, locking
	 * `amount` of the caller's `asset`.
	 */
	Receipt lock(Context const& ctx, LockArgs const& args);
	/** Htlc::Ledger::lock_as_resolver
	 *
	 * @brief creates the counter-leg escrow paired to
	 * `source_escrow_id`; the caller must be an
	 * authorized resolver.
	 */
	Receipt lock_as_resolver(Context const& ctx, ResolverLockArgs const& args);
	/** Htlc::Ledger::withdraw
	 *
	 * @brief releases the escrow to its receiver, who
	 * must be the caller, on presentation of the secret.
	 */
	Receipt withdraw( Context const& ctx
			, Sha256::Hash const& escrow_id
			, std::string const& secret
			);
	/** Htlc::Ledger::cancel
	 *
	 * @brief refunds the escrow to its sender, who must
	 * be the caller, once the timelock has passed.
	 */
	Receipt cancel(Context const& ctx, Sha256::Hash const& escrow_id);

	/** Htlc::Ledger::current_rate
	 *
	 * @brief the auction rate of the escrow of the given
	 * order at time `now`, or `Htlc::NO_AUCTION`.
	 *
	 * @desc With `strict`, asking outside the auction
	 * window is a `TimingError`.
	 */
	std::uint64_t current_rate( std::string const& order_id
				  , std::uint64_t now
				  , bool strict = false
				  ) const;

	/* Owner-only administration.  */
	void set_resolver( Context const& ctx
			 , std::string const& resolver
			 , bool authorized
			 );
	void deposit( Context const& ctx
		    , std::string const& account
		    , std::string const& asset
		    , std::uint64_t amount
		    );

	bool is_resolver(std::string const& account) const;
	std::uint64_t balance( std::string const& account
			     , std::string const& asset
			     ) const;

	/* Lookups; null when absent.  */
	Escrow const* get(Sha256::Hash const& escrow_id) const;
	Escrow const* find_by_order(std::string const& order_id) const;
	/* The escrow linked to the given one, or the zero
	 * hash.  */
	Sha256::Hash paired(Sha256::Hash const& escrow_id) const;

	/* Current block height; 0 before any transaction.  */
	std::uint64_t head() const;
	/* Produces empty blocks.  */
	void advance(std::uint64_t blocks);
	/* Events at or after the given block, in order.  */
	std::vector<Event> events_since(std::uint64_t block) const;
};

}

#endif /* !defined(HTLC_LEDGER_HPP) */
