#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the given action on the libev default
 * loop, returning its exit code once every greenthread
 * and watcher has finished.
 *
 * @desc An unhandled exception in the main action
 * gives exit code 254.
 */
int start(Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
