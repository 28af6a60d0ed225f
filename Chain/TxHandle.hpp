#ifndef CHAIN_TXHANDLE_HPP
#define CHAIN_TXHANDLE_HPP

#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>

namespace Chain {

/** struct Chain::TxHandle
 *
 * @brief a submitted, not necessarily confirmed,
 * transaction.
 *
 * @desc Pass to `LedgerAdapter::wait_confirmed`.
 * `block_number` is where the transaction was
 * included, 0 if not yet known.
 */
struct TxHandle {
	std::string chain;
	Sha256::Hash tx_hash;
	Sha256::Hash escrow_id;
	std::uint64_t block_number;
};

}

#endif /* !defined(CHAIN_TXHANDLE_HPP) */
