#ifndef HTLC_ERROR_HPP
#define HTLC_ERROR_HPP

#include"Htlc/ErrorCode.hpp"
#include<stdexcept>
#include<string>

namespace Htlc {

/** class Htlc::Error
 *
 * @brief base of every exception thrown by a
 * rejected ledger operation.
 *
 * @desc A rejected operation never changes ledger
 * state.
 * Catch a category subclass to handle a whole class
 * of rejections, or inspect `code()`.
 */
class Error : public std::runtime_error {
private:
	ErrorCode c;

public:
	Error(ErrorCode c_, std::string const& msg)
		: std::runtime_error(msg)
		, c(c_) { }

	ErrorCode code() const { return c; }
	ErrorCategory category() const { return category_of(c); }
};

/* Malformed lock or auction parameters.  */
class ValidationError : public Error {
public:
	ValidationError(ErrorCode c, std::string const& msg)
		: Error(c, msg) { }
};
/* Duplicate ids, or an escrow already in a terminal state.  */
class StateConflictError : public Error {
public:
	StateConflictError(ErrorCode c, std::string const& msg)
		: Error(c, msg) { }
};
class AuthorizationError : public Error {
public:
	AuthorizationError(ErrorCode c, std::string const& msg)
		: Error(c, msg) { }
};
/* Timelock not yet expired, or auction window not active.  */
class TimingError : public Error {
public:
	TimingError(ErrorCode c, std::string const& msg)
		: Error(c, msg) { }
};
/* A secret that does not hash to the committed hash.  */
class ProtocolViolationError : public Error {
public:
	ProtocolViolationError(ErrorCode c, std::string const& msg)
		: Error(c, msg) { }
};

/** Htlc::throw_error
 *
 * @brief throws the exception class matching the
 * category of the given code.
 */
void throw_error(ErrorCode c, std::string const& msg);

}

#endif /* !defined(HTLC_ERROR_HPP) */
