#ifndef EV_DETAIL_ON_IDLE_HPP
#define EV_DETAIL_ON_IDLE_HPP

#include<exception>
#include<functional>

namespace Ev { namespace Detail {

/* Runs `f` once, the next time the default loop has
 * nothing else pending.  */
void on_idle(std::function<void()> f);

/* Describes an exception that escaped a greenthread.  */
void report_unhandled(char const* where, std::exception_ptr e);

}}

#endif /* !defined(EV_DETAIL_ON_IDLE_HPP) */
