#ifndef CHAIN_ERROR_HPP
#define CHAIN_ERROR_HPP

#include"Htlc/ErrorCode.hpp"
#include<stdexcept>
#include<string>

namespace Chain {

/** class Chain::TransientError
 *
 * @brief the chain could not be reached, or a
 * confirmation did not arrive in time.
 *
 * @desc The operation may succeed if retried later.
 */
class TransientError : public std::runtime_error {
public:
	TransientError(std::string const& msg)
		: std::runtime_error(msg) { }
};

/** class Chain::RevertedError
 *
 * @brief the ledger rejected the transaction.
 */
class RevertedError : public std::runtime_error {
private:
	Htlc::ErrorCode c;

public:
	RevertedError(Htlc::ErrorCode c_, std::string const& msg)
		: std::runtime_error(msg)
		, c(c_) { }

	Htlc::ErrorCode code() const { return c; }
};

}

#endif /* !defined(CHAIN_ERROR_HPP) */
