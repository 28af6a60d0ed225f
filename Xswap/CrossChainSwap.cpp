#include"Xswap/CrossChainSwap.hpp"

namespace Xswap {

char const* to_string(Leg::State s) {
	switch (s) {
	case Leg::Absent: return "absent";
	case Leg::Locked: return "locked";
	case Leg::Withdrawn: return "withdrawn";
	case Leg::Cancelled: return "cancelled";
	}
	return "unknown";
}

char const* to_string(CrossChainSwap::Status s) {
	switch (s) {
	case CrossChainSwap::Initiated: return "initiated";
	case CrossChainSwap::SourceLocked: return "source_locked";
	case CrossChainSwap::DestLocked: return "dest_locked";
	case CrossChainSwap::SecretRevealed: return "secret_revealed";
	case CrossChainSwap::Recovering: return "recovering";
	case CrossChainSwap::Completed: return "completed";
	case CrossChainSwap::Failed: return "failed";
	}
	return "unknown";
}

bool advance(CrossChainSwap& swap, CrossChainSwap::Status to) {
	if (swap.terminal())
		return false;
	if (swap.status == CrossChainSwap::Recovering) {
		if ( to != CrossChainSwap::SecretRevealed
		  && to != CrossChainSwap::Completed
		  && to != CrossChainSwap::Failed
		   )
			return false;
		swap.status = to;
		return true;
	}
	if (int(to) <= int(swap.status))
		return false;
	swap.status = to;
	return true;
}

}
