#ifndef XSWAP_STATE_HPP
#define XSWAP_STATE_HPP

#include"Xswap/CrossChainSwap.hpp"
#include"Xswap/ErrorLog.hpp"
#include"Xswap/Order.hpp"
#include<cstdint>
#include<map>
#include<string>
#include<vector>

namespace Json { class Out; }

namespace Xswap {

struct Metrics {
	std::uint64_t total_orders;
	std::uint64_t successful_orders;
	std::uint64_t failed_orders;
	std::uint64_t cancelled_orders;
	/* Sum of the source amounts of completed swaps.  */
	std::uint64_t total_volume;
	/* Seconds from swap creation to completion.  */
	double average_execution_time;
	std::uint64_t uptime;

	Metrics() : total_orders(0)
		  , successful_orders(0)
		  , failed_orders(0)
		  , cancelled_orders(0)
		  , total_volume(0)
		  , average_execution_time(0)
		  , uptime(0)
		  { }
};

/** struct Xswap::State
 *
 * @brief snapshot of the coordinator for the API
 * layer.
 *
 * @desc `pending_swaps` holds the non-terminal
 * swaps, `active_orders` the non-terminal orders.
 */
struct State {
	bool running;
	std::vector<std::string> connected_chains;
	std::map<std::string, std::uint64_t> last_block;
	std::vector<CrossChainSwap> pending_swaps;
	std::vector<Order> active_orders;
	Metrics metrics;
	std::vector<ErrorRecord> errors;
};

Json::Out order_to_json(Order const&);
Json::Out swap_to_json(CrossChainSwap const&);
Json::Out state_to_json(State const&);

}

#endif /* !defined(XSWAP_STATE_HPP) */
