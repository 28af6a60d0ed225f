#ifndef XSWAP_SHUTDOWN_HPP
#define XSWAP_SHUTDOWN_HPP

namespace Xswap {

/** struct Xswap::Shutdown
 *
 * @brief broadcast on the bus when the service is
 * stopping, and thrown by blocking Ev::Io
 * operations that were interrupted by it.
 */
struct Shutdown {};

}

#endif /* !defined(XSWAP_SHUTDOWN_HPP) */
