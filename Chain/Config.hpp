#ifndef CHAIN_CONFIG_HPP
#define CHAIN_CONFIG_HPP

#include<cstdint>
#include<stdexcept>
#include<string>
#include<vector>

namespace Chain {

/** struct Chain::Config
 *
 * @brief everything the service needs to know about
 * one monitored chain.
 *
 * @desc Confirmation depth and block time differ per
 * chain and must never be assumed constant.
 */
struct Config {
	std::string name;
	std::uint64_t chain_id;
	/* Depth at which a transaction counts as final.  */
	std::uint64_t confirmations;
	/* Expected seconds between blocks.  */
	double block_time;
	/* Where the adapter connects; "local" for the
	 * in-process chain.  */
	std::string endpoint;
	/* Our own account on this chain.  */
	std::string account;
};

/* Entry of the table of known networks.  */
struct Network {
	char const* name;
	std::uint64_t chain_id;
	std::uint64_t confirmations;
	double block_time;
};
std::vector<Network> const& known_networks();

struct ConfigError : public std::invalid_argument {
	ConfigError(std::string const& msg)
		: std::invalid_argument(
			"Chain config: " + msg
		  ) { }
};

/** Chain::parse_config
 *
 * @brief parses `NAME[:key=value,...]`.
 *
 * @desc NAME picks defaults from `known_networks()`;
 * an unknown NAME needs an explicit `id`.
 * Keys: id, confirmations, block-time, endpoint,
 * account.
 * Throws `Chain::ConfigError`.
 */
Config parse_config(std::string const& text);

}

#endif /* !defined(CHAIN_CONFIG_HPP) */
