#include"Htlc/Error.hpp"

namespace Htlc {

ErrorCategory category_of(ErrorCode c) {
	switch (c) {
	case InvalidAmount:
	case InvalidAddress:
	case TimelockOutOfRange:
	case InvalidAuctionParameters:
	case InsufficientFunds:
	case InvalidSecretHash:
	case InvalidOrderId:
	case InvalidSourceEscrow:
		return Validation;
	case NotFound:
	case AlreadyExists:
	case AlreadyWithdrawn:
	case AlreadyCancelled:
		return StateConflict;
	case Unauthorized:
		return Authorization;
	case TimelockNotExpired:
	case AuctionNotActive:
		return Timing;
	case InvalidSecret:
		return ProtocolViolation;
	}
	return Validation;
}

char const* to_string(ErrorCode c) {
	switch (c) {
	case NotFound: return "NotFound";
	case AlreadyExists: return "AlreadyExists";
	case AlreadyWithdrawn: return "AlreadyWithdrawn";
	case AlreadyCancelled: return "AlreadyCancelled";
	case Unauthorized: return "Unauthorized";
	case InvalidSecret: return "InvalidSecret";
	case InvalidAmount: return "InvalidAmount";
	case InvalidAddress: return "InvalidAddress";
	case TimelockOutOfRange: return "TimelockOutOfRange";
	case InvalidAuctionParameters: return "InvalidAuctionParameters";
	case TimelockNotExpired: return "TimelockNotExpired";
	case InsufficientFunds: return "InsufficientFunds";
	case InvalidSecretHash: return "InvalidSecretHash";
	case InvalidOrderId: return "InvalidOrderId";
	case InvalidSourceEscrow: return "InvalidSourceEscrow";
	case AuctionNotActive: return "AuctionNotActive";
	}
	return "Unknown";
}

void throw_error(ErrorCode c, std::string const& msg) {
	auto full = std::string(to_string(c)) + ": " + msg;
	switch (category_of(c)) {
	case Validation:
		throw ValidationError(c, full);
	case StateConflict:
		throw StateConflictError(c, full);
	case Authorization:
		throw AuthorizationError(c, full);
	case Timing:
		throw TimingError(c, full);
	case ProtocolViolation:
		throw ProtocolViolationError(c, full);
	}
	throw Error(c, full);
}

}
