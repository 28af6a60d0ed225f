#include"Chain/Config.hpp"
#include"Util/Str.hpp"
#include<cstdlib>

namespace Chain {

std::vector<Network> const& known_networks() {
	static auto const table = std::vector<Network>{
		{"etherlink", 42793, 2, 0.5},
		{"etherlink-testnet", 128123, 2, 0.5},
		{"monad", 1337, 3, 1.0},
		{"monad-testnet", 1338, 3, 1.0},
		{"ethereum", 1, 12, 12.0},
		{"arbitrum", 42161, 20, 0.25},
		{"optimism", 10, 10, 2.0},
		{"polygon", 137, 64, 2.0},
		{"sepolia", 11155111, 6, 12.0}
	};
	return table;
}

namespace {

double to_seconds(std::string const& key, std::string const& v) {
	char* end = nullptr;
	auto d = std::strtod(v.c_str(), &end);
	if (v.empty() || *end != '\0' || d < 0)
		throw ConfigError(key + ": not a duration: " + v);
	return d;
}
std::uint64_t to_number(std::string const& key, std::string const& v) {
	try {
		return Util::Str::to_u64(v);
	} catch (std::invalid_argument const& e) {
		throw ConfigError(key + ": " + e.what());
	}
}

}

Config parse_config(std::string const& text) {
	auto colon = text.find(':');
	auto name = Util::Str::trim(text.substr(0, colon));
	if (name.empty())
		throw ConfigError("missing chain name in '" + text + "'");

	auto ret = Config();
	ret.name = name;
	ret.chain_id = 0;
	ret.confirmations = 1;
	ret.block_time = 1.0;
	ret.endpoint = "local";
	ret.account = "relayer";
	auto known = false;
	for (auto const& n : known_networks()) {
		if (name != n.name)
			continue;
		ret.chain_id = n.chain_id;
		ret.confirmations = n.confirmations;
		ret.block_time = n.block_time;
		known = true;
		break;
	}

	auto has_id = false;
	if (colon != std::string::npos) {
		for (auto const& item : Util::Str::split(text.substr(colon + 1), ',')) {
			auto eq = item.find('=');
			if (eq == std::string::npos)
				throw ConfigError("expected key=value, got '" + item + "'");
			auto key = Util::Str::trim(item.substr(0, eq));
			auto value = Util::Str::trim(item.substr(eq + 1));
			if (key == "id") {
				ret.chain_id = to_number(key, value);
				has_id = true;
			} else if (key == "confirmations")
				ret.confirmations = to_number(key, value);
			else if (key == "block-time")
				ret.block_time = to_seconds(key, value);
			else if (key == "endpoint")
				ret.endpoint = value;
			else if (key == "account")
				ret.account = value;
			else
				throw ConfigError("unknown key '" + key + "'");
		}
	}

	if (!known && !has_id)
		throw ConfigError("unknown network '" + name + "' needs id=");
	if (ret.confirmations == 0)
		throw ConfigError(name + ": confirmations must be at least 1");
	if (ret.account.empty())
		throw ConfigError(name + ": empty account");
	return ret;
}

}
