#ifndef XSWAP_CROSSCHAINSWAP_HPP
#define XSWAP_CROSSCHAINSWAP_HPP

#include"Chain/TxHandle.hpp"
#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>

namespace Xswap {

/** struct Xswap::Leg
 *
 * @brief what the coordinator knows about one side
 * of a swap.
 */
struct Leg {
	enum State
	{ Absent
	, Locked
	, Withdrawn
	, Cancelled
	};

	std::string chain;
	Sha256::Hash escrow_id;
	State state;
	std::string sender;
	std::string receiver;
	std::uint64_t amount;
	std::uint64_t timelock;
	std::uint64_t created_block;
	/* We already asked the ledger to refund it.  */
	bool cancel_submitted;
	/* We already told the sender it may reclaim it.  */
	bool reclaim_notified;

	Leg() : state(Absent)
	      , amount(0)
	      , timelock(0)
	      , created_block(0)
	      , cancel_submitted(false)
	      , reclaim_notified(false)
	      { }
};

char const* to_string(Leg::State);

/** struct Xswap::CrossChainSwap
 *
 * @brief correlation record tying the two legs of
 * one order together.
 *
 * @desc Everything here can be rebuilt by replaying
 * both ledgers' events, the secret included, since
 * it becomes public on the first withdrawal.
 */
struct CrossChainSwap {
	enum Status
	{ Initiated
	, SourceLocked
	, DestLocked
	, SecretRevealed
	, Recovering
	, Completed
	, Failed
	};

	std::string order_id;
	Leg source;
	Leg dest;
	bool has_secret;
	std::string secret;
	Status status;
	std::uint64_t created_at;
	std::uint64_t updated_at;
	std::uint64_t completed_at;
	std::uint64_t execution_deadline;

	/* The counter-withdrawal on the source leg: once
	 * submitted it is never submitted again, only its
	 * confirmation is awaited.  */
	bool counter_withdraw_submitted;
	bool counter_withdraw_pending;
	Chain::TxHandle counter_withdraw;

	CrossChainSwap() : has_secret(false)
			 , status(Initiated)
			 , created_at(0)
			 , updated_at(0)
			 , completed_at(0)
			 , execution_deadline(0)
			 , counter_withdraw_submitted(false)
			 , counter_withdraw_pending(false)
			 , counter_withdraw{"", Sha256::Hash(), Sha256::Hash(), 0}
			 { }

	bool terminal() const {
		return status == Completed || status == Failed;
	}
};

char const* to_string(CrossChainSwap::Status);

/** Xswap::advance
 *
 * @brief moves the swap forward to `to`, never
 * back; returns whether it moved.
 *
 * @desc `Recovering` can still be left for
 * `SecretRevealed` or a terminal status, since a
 * counterparty may act after the deadline.
 */
bool advance(CrossChainSwap& swap, CrossChainSwap::Status to);

}

#endif /* !defined(XSWAP_CROSSCHAINSWAP_HPP) */
