#ifndef XSWAP_MOD_FEEDWRITER_HPP
#define XSWAP_MOD_FEEDWRITER_HPP

namespace S { class Bus; }

namespace Xswap { namespace Mod {

/** class Xswap::Mod::FeedWriter
 *
 * @brief turns the coordinator's notifications into
 * `Xswap::Msg::JsonCout` lines for API clients.
 *
 * @desc Each line is an object with a `type` of
 * `escrowEvent`, `swapCompleted` or `auctionUpdate`,
 * and the payload under `data`.
 */
class FeedWriter {
public:
	FeedWriter() =delete;
	FeedWriter(FeedWriter const&) =delete;

	explicit
	FeedWriter(S::Bus& bus);
};

}}

#endif /* !defined(XSWAP_MOD_FEEDWRITER_HPP) */
