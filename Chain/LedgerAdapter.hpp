#ifndef CHAIN_LEDGERADAPTER_HPP
#define CHAIN_LEDGERADAPTER_HPP

#include"Chain/Config.hpp"
#include"Chain/EscrowEvent.hpp"
#include"Chain/TxHandle.hpp"
#include"Htlc/Ledger.hpp"
#include<cstdint>
#include<functional>
#include<string>

namespace Ev { template<typename a> class Io; }

namespace Chain {

/** class Chain::LedgerAdapter
 *
 * @brief the coordinator's only way of talking to one
 * chain's escrow ledger.
 *
 * @desc Implementations own their connection to the
 * chain.
 * Transient connectivity problems are reported as
 * `Chain::TransientError`, and ledger rejections as
 * `Chain::RevertedError`, both through the `Ev::Io`
 * failure path.
 */
class LedgerAdapter {
public:
	virtual ~LedgerAdapter() { }

	virtual Chain::Config const& config() const =0;
	std::string const& name() const { return config().name; }
	/* The account our submissions are signed with.  */
	std::string const& account() const { return config().account; }

	/** Chain::LedgerAdapter::subscribe
	 *
	 * @brief delivers every escrow event at or after
	 * block `from_block`, in ledger order, then keeps
	 * delivering new ones until `close()`.
	 *
	 * @desc The returned action completes once the
	 * subscription is in place; delivery happens in a
	 * separate greenthread.
	 * The next event is not delivered until the action
	 * returned by `on_event` for the previous one
	 * completes.
	 * Events are never skipped: after a connectivity
	 * loss delivery resumes from the first undelivered
	 * block.
	 */
	virtual
	Ev::Io<void>
	subscribe( std::uint64_t from_block
		 , std::function<Ev::Io<void>(Chain::EscrowEvent)> on_event
		 ) =0;

	/** Chain::LedgerAdapter::submit_*
	 *
	 * @brief sends the ledger transaction and returns
	 * as soon as it is accepted, without waiting for
	 * confirmations.
	 */
	virtual Ev::Io<TxHandle> submit_lock(Htlc::LockArgs args) =0;
	virtual Ev::Io<TxHandle> submit_lock_as_resolver(Htlc::ResolverLockArgs args) =0;
	virtual Ev::Io<TxHandle> submit_withdraw( Sha256::Hash escrow_id
						, std::string secret
						) =0;
	virtual Ev::Io<TxHandle> submit_cancel(Sha256::Hash escrow_id) =0;

	/** Chain::LedgerAdapter::wait_confirmed
	 *
	 * @brief suspends until the transaction is buried
	 * `confirmations` deep.
	 *
	 * @desc Fails with `Chain::TransientError` on
	 * timeout or connectivity loss.
	 */
	virtual
	Ev::Io<void> wait_confirmed( TxHandle handle
				   , std::uint64_t confirmations
				   ) =0;

	/* The ledger's current auction rate for the order,
	 * or Htlc::NO_AUCTION.  */
	virtual Ev::Io<std::uint64_t> current_rate(std::string order_id) =0;
	/* The chain's current block height.  */
	virtual Ev::Io<std::uint64_t> head() =0;
	virtual Ev::Io<bool> is_healthy() =0;

	/** Chain::LedgerAdapter::refuse_submissions
	 *
	 * @brief every later `submit_*`, including a retry
	 * already waiting out its backoff, fails with
	 * `Chain::TransientError` without reaching the
	 * ledger.  Events are still delivered.
	 */
	virtual Ev::Io<void> refuse_submissions() =0;

	/* Stops event delivery; submissions fail afterwards.  */
	virtual Ev::Io<void> close() =0;
};

}

#endif /* !defined(CHAIN_LEDGERADAPTER_HPP) */
