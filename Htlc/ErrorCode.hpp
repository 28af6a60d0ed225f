#ifndef HTLC_ERRORCODE_HPP
#define HTLC_ERRORCODE_HPP

namespace Htlc {

/* Reasons a ledger operation is rejected.
 * /!\ Adapters put these on the wire, do not renumber!  */
enum ErrorCode
{ NotFound = 0
, AlreadyExists = 1
, AlreadyWithdrawn = 2
, AlreadyCancelled = 3
, Unauthorized = 4
, InvalidSecret = 5
, InvalidAmount = 6
, InvalidAddress = 7
, TimelockOutOfRange = 8
, InvalidAuctionParameters = 9
, TimelockNotExpired = 10
, InsufficientFunds = 11
, InvalidSecretHash = 12
, InvalidOrderId = 13
, InvalidSourceEscrow = 14
, AuctionNotActive = 15
};

/* Broad classes of rejection; each maps to one
 * exception type.  */
enum ErrorCategory
{ Validation
, StateConflict
, Authorization
, Timing
, ProtocolViolation
};

ErrorCategory category_of(ErrorCode);
char const* to_string(ErrorCode);

}

#endif /* !defined(HTLC_ERRORCODE_HPP) */
