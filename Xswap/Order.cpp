#include"Xswap/Order.hpp"

namespace Xswap {

char const* to_string(Order::Status s) {
	switch (s) {
	case Order::Pending: return "pending";
	case Order::AuctionActive: return "auction_active";
	case Order::Accepted: return "accepted";
	case Order::Executing: return "executing";
	case Order::Completed: return "completed";
	case Order::Cancelled: return "cancelled";
	case Order::Expired: return "expired";
	case Order::Failed: return "failed";
	}
	return "unknown";
}

bool advance(Order& order, Order::Status to) {
	if (order.terminal())
		return false;
	if (int(to) <= int(order.status))
		return false;
	order.status = to;
	return true;
}

}
