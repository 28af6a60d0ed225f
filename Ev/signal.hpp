#ifndef EV_SIGNAL_HPP
#define EV_SIGNAL_HPP

#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::signal
 *
 * @brief suspends until one of the given signals is
 * delivered to the process, then returns its number.
 *
 * @desc The signals are only watched while the
 * action is suspended; their default disposition
 * applies otherwise.
 * Only usable with the default loop.
 */
Ev::Io<int> signal(std::vector<int> signums);

}

#endif /* !defined(EV_SIGNAL_HPP) */
