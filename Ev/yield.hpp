#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief lets every other ready greenthread run
 * before continuing.
 *
 * @desc Anything shared with other greenthreads may
 * have changed once this completes.
 * Functions that can yield say so in their
 * documentation.
 *
 * The counted form yields `n` times in a row; tests
 * use it to let modules settle.
 */
Ev::Io<void> yield();
Ev::Io<void> yield(std::size_t n);

}

#endif /* !defined(EV_YIELD_HPP) */
