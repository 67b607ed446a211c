#ifndef PFS_MAIN_HPP
#define PFS_MAIN_HPP

#include<istream>
#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Pfs {

/** class Pfs::Main
 *
 * @brief the whole service: parses the command line,
 * then serves JSON-RPC on `cin` until end-of-file.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() = delete;

	Main( std::vector<std::string> argv
	    , std::istream& cin
	    , std::ostream& cout
	    , std::ostream& cerr
	    );
	Main(Main&&);
	~Main();

	/* Returns the process exit code.  */
	Ev::Io<int> run();
};

}

#endif /* !defined(PFS_MAIN_HPP) */
