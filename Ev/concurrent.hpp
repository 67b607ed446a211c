#ifndef EV_CONCURRENT_HPP
#define EV_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::concurrent
 *
 * @brief starts the given action in a new greenthread
 * when the current greenthread yields, and returns
 * immediately.
 *
 * @desc a failure in the new greenthread is reported on
 * stderr; the main loop continues.
 */
Ev::Io<void> concurrent(Ev::Io<void> io);

}

#endif /* EV_CONCURRENT_HPP */
