#ifndef CHAIN_LOCALADAPTER_HPP
#define CHAIN_LOCALADAPTER_HPP

#include"Chain/LedgerAdapter.hpp"
#include<cstddef>
#include<memory>

namespace Chain { class LocalChain; }
namespace S { class Bus; }
namespace Xswap { namespace Mod { class Waiter; }}

namespace Chain {

/** struct Chain::RetryPolicy
 *
 * @brief bounded exponential backoff for
 * submissions, and the limit on waiting for
 * confirmations.
 */
struct RetryPolicy {
	std::size_t max_attempts;
	double initial_backoff;
	double max_backoff;
	double confirm_timeout;

	RetryPolicy() : max_attempts(5)
		      , initial_backoff(0.5)
		      , max_backoff(8.0)
		      , confirm_timeout(600.0)
		      { }
};

/** class Chain::LocalAdapter
 *
 * @brief `Chain::LedgerAdapter` over an in-process
 * `Chain::LocalChain`.
 *
 * @desc Submissions are signed as `config.account`.
 * Besides the adapter contract it can simulate a
 * misbehaving connection, for exercising the
 * recovery paths of its users.
 */
class LocalAdapter : public LedgerAdapter {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	LocalAdapter() =delete;
	LocalAdapter(LocalAdapter const&) =delete;
	LocalAdapter(LocalAdapter&&) =delete;
	~LocalAdapter();

	LocalAdapter( S::Bus& bus
		    , Xswap::Mod::Waiter& waiter
		    , LocalChain& chain
		    , Config config
		    , RetryPolicy retry = RetryPolicy()
		    );

	Chain::Config const& config() const override;

	Ev::Io<void>
	subscribe( std::uint64_t from_block
		 , std::function<Ev::Io<void>(Chain::EscrowEvent)> on_event
		 ) override;

	Ev::Io<TxHandle> submit_lock(Htlc::LockArgs args) override;
	Ev::Io<TxHandle> submit_lock_as_resolver(Htlc::ResolverLockArgs args) override;
	Ev::Io<TxHandle> submit_withdraw( Sha256::Hash escrow_id
					, std::string secret
					) override;
	Ev::Io<TxHandle> submit_cancel(Sha256::Hash escrow_id) override;

	Ev::Io<void> wait_confirmed( TxHandle handle
				   , std::uint64_t confirmations
				   ) override;

	Ev::Io<std::uint64_t> current_rate(std::string order_id) override;
	Ev::Io<std::uint64_t> head() override;
	Ev::Io<bool> is_healthy() override;
	Ev::Io<void> refuse_submissions() override;
	Ev::Io<void> close() override;

	/* Simulates losing and regaining the connection.
	 * While unreachable every call fails with
	 * `Chain::TransientError` and delivery pauses.  */
	void set_reachable(bool);
	/* The next `n` submissions fail transiently.  */
	void fail_next(std::size_t n);
	/* Delivers an event that is not on the ledger,
	 * ahead of any further ledger events.  */
	void inject(Htlc::Event event);
};

}

#endif /* !defined(CHAIN_LOCALADAPTER_HPP) */
