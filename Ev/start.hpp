#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief run the given action on the libev default loop
 * until the loop has no more active watchers, then return
 * the exit code the action produced.
 *
 * @desc if the action fails with an exception, it is
 * reported on stderr and 254 is returned.
 * Returns 255 if the loop could not be created or the
 * action never completed.
 */
int start(Ev::Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
