#ifndef XSWAP_CONCURRENT_HPP
#define XSWAP_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Xswap {

/* Starts a background greenthread, as Ev::concurrent,
 * that ends quietly when interrupted by
 * Xswap::Shutdown.  Any other exception is still
 * reported as unhandled.  */
Ev::Io<void> concurrent(Ev::Io<void>);

}

#endif /* !defined(XSWAP_CONCURRENT_HPP) */
