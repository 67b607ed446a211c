#ifndef EV_DETAIL_IDLE_HPP
#define EV_DETAIL_IDLE_HPP

#include<exception>
#include<functional>

namespace Ev { namespace Detail {

/** Ev::Detail::on_idle
 *
 * @brief schedules the given function to be called
 * once, from the default loop, the next time the loop
 * has nothing else pending.
 */
void on_idle(std::function<void()> f);

/* Prints a failure that nobody is left to handle.  */
void report_unhandled(char const* where, std::exception_ptr e);

}}

#endif /* !defined(EV_DETAIL_IDLE_HPP) */
