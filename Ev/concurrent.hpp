#ifndef EV_CONCURRENT_HPP
#define EV_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::concurrent
 *
 * @brief launches `io` as a new greenthread and
 * completes immediately.
 *
 * @desc The new greenthread starts at the next
 * yield point of the caller.
 * Exceptions escaping it are printed on stderr and
 * otherwise dropped; wrap it if that matters.
 */
Ev::Io<void> concurrent(Ev::Io<void> io);

}

#endif /* !defined(EV_CONCURRENT_HPP) */
