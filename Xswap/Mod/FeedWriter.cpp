#include"Auction/rate.hpp"
#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Xswap/Mod/FeedWriter.hpp"
#include"Xswap/Msg/AuctionUpdate.hpp"
#include"Xswap/Msg/EscrowEventNotice.hpp"
#include"Xswap/Msg/JsonCout.hpp"
#include"Xswap/Msg/SwapCompleted.hpp"
#include"Xswap/State.hpp"

namespace {

Json::Out event_to_json(Chain::EscrowEvent const& ev) {
	auto const& e = ev.event;
	auto out = Json::Out();
	auto obj = out.start_object();
	obj
		.field("network", ev.chain)
		.field("event", std::string(Htlc::to_string(e.type)))
		.field("escrowId", std::string(e.escrow_id))
		.field("orderId", e.order_id)
		.field("blockNumber", e.block_number)
		.field("txHash", std::string(e.tx_hash))
		;
	switch (e.type) {
	case Htlc::Event::Created:
		obj
			.field("sender", e.sender)
			.field("receiver", e.receiver)
			.field("resolver", e.resolver)
			.field("amount", e.amount)
			.field("asset", e.asset)
			.field("secretHash", std::string(e.secret_hash))
			.field("timelock", e.timelock)
			.field("isResolverLeg", e.is_resolver_leg)
			.field("startRate", Auction::display_rate(e.start_rate))
			.field("endRate", Auction::display_rate(e.end_rate))
			;
		break;
	case Htlc::Event::Withdrawn:
		obj
			.field("receiver", e.receiver)
			.field("secret", e.secret)
			.field("executionRate", Auction::display_rate(e.execution_rate))
			;
		break;
	case Htlc::Event::Cancelled:
		obj
			.field("sender", e.sender)
			.field("refundAmount", e.refund_amount)
			;
		break;
	case Htlc::Event::Unknown:
		obj.field("typeName", e.type_name);
		break;
	}
	obj.end_object();
	return out;
}

Json::Out wrap(char const* type, Json::Out data) {
	return Json::Out()
		.start_object()
			.field("type", std::string(type))
			.field("data", data)
		.end_object()
		;
}

}

namespace Xswap { namespace Mod {

FeedWriter::FeedWriter(S::Bus& bus) {
	bus.subscribe<Msg::EscrowEventNotice
		     >([&bus](Msg::EscrowEventNotice const& n) {
		return bus.raise(Msg::JsonCout{
			wrap("escrowEvent", event_to_json(n.event))
		});
	});
	bus.subscribe<Msg::SwapCompleted
		     >([&bus](Msg::SwapCompleted const& n) {
		auto data = Json::Out()
			.start_object()
				.field("order", order_to_json(n.order))
				.field("swap", swap_to_json(n.swap))
			.end_object()
			;
		return bus.raise(Msg::JsonCout{
			wrap("swapCompleted", std::move(data))
		});
	});
	bus.subscribe<Msg::AuctionUpdate
		     >([&bus](Msg::AuctionUpdate const& u) {
		auto data = Json::Out()
			.start_object()
				.field("orderId", u.order_id)
				.field("currentRate", Auction::display_rate(u.current_rate))
				.field("timeElapsed", u.time_elapsed)
				.field("totalDuration", u.total_duration)
				.field("percentageComplete", u.percentage_complete)
				.field("isActive", u.is_active)
			.end_object()
			;
		return bus.raise(Msg::JsonCout{
			wrap("auctionUpdate", std::move(data))
		});
	});
}

}}
