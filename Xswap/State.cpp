#include"Auction/rate.hpp"
#include"Json/Out.hpp"
#include"Xswap/State.hpp"

namespace {

template<typename Up>
void leg_fields(Json::Detail::Object<Up>& obj, Xswap::Leg const& leg) {
	obj
		.field("chain", leg.chain)
		.field("escrowId", std::string(leg.escrow_id))
		.field("state", std::string(Xswap::to_string(leg.state)))
		.field("sender", leg.sender)
		.field("receiver", leg.receiver)
		.field("amount", leg.amount)
		.field("timelock", leg.timelock)
		.field("createdBlock", leg.created_block)
		;
}

}

namespace Xswap {

Json::Out order_to_json(Order const& o) {
	return Json::Out()
		.start_object()
			.field("orderId", o.order_id)
			.field("maker", o.maker)
			.field("receiver", o.receiver)
			.field("srcChain", o.src_chain)
			.field("destChain", o.dest_chain)
			.field("srcAsset", o.src_asset)
			.field("destAsset", o.dest_asset)
			.field("srcAmount", o.src_amount)
			.field("destAmount", o.dest_amount)
			.field("secretHash", std::string(o.secret_hash))
			.field("timelock", o.timelock)
			.field("auctionStartTime", o.auction_start)
			.field("auctionEndTime", o.auction_end)
			.field("startRate", Auction::display_rate(o.start_rate))
			.field("endRate", Auction::display_rate(o.end_rate))
			.field("status", std::string(to_string(o.status)))
		.end_object()
		;
}

Json::Out swap_to_json(CrossChainSwap const& s) {
	auto out = Json::Out();
	auto obj = out.start_object();
	obj
		.field("orderId", s.order_id)
		.field("sourceChain", s.source.chain)
		.field("destChain", s.dest.chain)
		.field("sourceEscrowId", std::string(s.source.escrow_id))
		.field("destEscrowId", std::string(s.dest.escrow_id))
		.field("status", std::string(to_string(s.status)))
		.field("createdAt", s.created_at)
		.field("updatedAt", s.updated_at)
		.field("executionDeadline", s.execution_deadline)
		;
	/* The secret is public once revealed on a ledger.  */
	if (s.has_secret)
		obj.field("secret", s.secret);
	if (s.completed_at != 0)
		obj.field("completedAt", s.completed_at);
	auto source = obj.start_object("sourceLeg");
	leg_fields(source, s.source);
	source.end_object();
	auto dest = obj.start_object("destLeg");
	leg_fields(dest, s.dest);
	dest.end_object();
	obj.end_object();
	return out;
}

Json::Out state_to_json(State const& st) {
	auto out = Json::Out();
	auto obj = out.start_object();
	obj.field("isRunning", st.running);

	auto chains = obj.start_array("connectedNetworks");
	for (auto const& c : st.connected_chains)
		chains.entry(c);
	chains.end_array();

	auto blocks = obj.start_object("lastBlockProcessed");
	for (auto const& b : st.last_block)
		blocks.field(b.first, b.second);
	blocks.end_object();

	auto swaps = obj.start_array("pendingSwaps");
	for (auto const& s : st.pending_swaps)
		swaps.entry(swap_to_json(s));
	swaps.end_array();

	auto orders = obj.start_array("activeOrders");
	for (auto const& o : st.active_orders)
		orders.entry(order_to_json(o));
	orders.end_array();

	auto const& m = st.metrics;
	obj.start_object("metrics")
		.field("totalOrders", m.total_orders)
		.field("successfulOrders", m.successful_orders)
		.field("failedOrders", m.failed_orders)
		.field("cancelledOrders", m.cancelled_orders)
		.field("averageExecutionTime", m.average_execution_time)
		.field("totalVolume", m.total_volume)
		.field("uptime", m.uptime)
	.end_object();

	auto errors = obj.start_array("errors");
	for (auto const& e : st.errors) {
		auto eo = errors.start_object();
		eo
			.field("timestamp", e.timestamp)
			.field("level", std::string(to_string(e.level)))
			.field("message", e.message)
			;
		if (!e.order_id.empty())
			eo.field("orderId", e.order_id);
		if (!e.chain.empty())
			eo.field("network", e.chain);
		eo.end_object();
	}
	errors.end_array();

	obj.end_object();
	return out;
}

}
