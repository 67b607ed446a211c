#ifndef PFS_JSONINPUT_HPP
#define PFS_JSONINPUT_HPP

#include<istream>
#include<memory>

namespace Ev { template<typename a> class Io; }
namespace Ev { class ThreadPool; }
namespace S { class Bus; }

namespace Pfs {

/** class Pfs::JsonInput
 *
 * @brief special module that reads cin one line at a
 * time and emits a Pfs::Msg::JsonCin for each JSON
 * datum.
 *
 * @desc Unlike other modules, this module has a run
 * function.
 * When the run function action returns, the input has
 * reached end-of-file.
 * Lines that do not parse are answered with a JSON-RPC
 * parse error and skipped.
 */
class JsonInput {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	explicit
	JsonInput( Ev::ThreadPool& threadpool
		 , std::istream& cin
		 , S::Bus& bus
		 );
	JsonInput(JsonInput&&);
	~JsonInput();

	Ev::Io<void> run();
};

}

#endif /* !defined(PFS_JSONINPUT_HPP) */
