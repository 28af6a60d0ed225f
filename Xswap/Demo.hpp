#ifndef XSWAP_DEMO_HPP
#define XSWAP_DEMO_HPP

namespace Chain { class LedgerAdapter; }
namespace Chain { class LocalChain; }
namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Xswap { namespace Mod { class SwapCoordinator; }}
namespace Xswap { namespace Mod { class Waiter; }}

namespace Xswap {

/** Xswap::demo
 *
 * @brief plays both counterparties of one swap from
 * `src` to `dst` against a running coordinator.
 *
 * @desc A maker locks on the source chain, our
 * account locks the counter leg on the destination
 * chain, and the maker withdraws it with the secret.
 * The coordinator is then expected to withdraw the
 * source leg on its own.
 *
 * The adapters must be the ones the coordinator
 * watches.
 * Returns 0 once the swap completes, 1 if it fails
 * or does not complete within `timeout` seconds.
 */
Ev::Io<int> demo( S::Bus& bus
		, Xswap::Mod::Waiter& waiter
		, Xswap::Mod::SwapCoordinator& coordinator
		, Chain::LocalChain& src_chain
		, Chain::LedgerAdapter& src
		, Chain::LocalChain& dst_chain
		, Chain::LedgerAdapter& dst
		, double timeout
		);

}

#endif /* !defined(XSWAP_DEMO_HPP) */
