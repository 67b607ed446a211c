#ifndef PFS_MOD_ALL_HPP
#define PFS_MOD_ALL_HPP

#include<memory>
#include<ostream>

namespace Ev { class ThreadPool; }
namespace S { class Bus; }
namespace Tn { class Network; }

namespace Pfs { namespace Mod {

/** Pfs::Mod::all
 *
 * @brief Constructs all the modules of the service.
 * Returns a shared pointer to an object that
 * cleans up all modules on destruction.
 */
std::shared_ptr<void> all( std::ostream& cout
			 , S::Bus& bus
			 , Ev::ThreadPool& threadpool
			 , Tn::Network& network
			 );

}}

#endif /* !defined(PFS_MOD_ALL_HPP) */
