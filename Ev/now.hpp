#ifndef EV_NOW_HPP
#define EV_NOW_HPP

namespace Ev {

/* Seconds since the epoch, as of the start of the
 * current loop iteration.  */
double now();

}

#endif /* !defined(EV_NOW_HPP) */
