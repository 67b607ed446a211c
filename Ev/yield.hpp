#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief lets the loop run other greenthreads before
 * continuing, num_yields times over.
 *
 * @desc state shared with other greenthreads can change
 * across the yield.
 */
Io<void> yield(std::size_t num_yields = 1);

}

#endif /* !defined(EV_YIELD_HPP) */
