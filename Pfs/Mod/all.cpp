#include"Pfs/Mod/CommandReceiver.hpp"
#include"Pfs/Mod/EventIngester.hpp"
#include"Pfs/Mod/EventParser.hpp"
#include"Pfs/Mod/InfoCommand.hpp"
#include"Pfs/Mod/JsonOutputter.hpp"
#include"Pfs/Mod/Logger.hpp"
#include"Pfs/Mod/PathQueryHandler.hpp"
#include"Pfs/Mod/all.hpp"
#include<vector>

namespace {

class All {
private:
	std::vector<std::shared_ptr<void>> modules;

public:
	template<typename M, typename... As>
	std::shared_ptr<M> install(As&&... as) {
		auto ptr = std::make_shared<M>(as...);
		modules.push_back(std::shared_ptr<void>(ptr));
		return ptr;
	}
};

}

namespace Pfs { namespace Mod {

std::shared_ptr<void> all( std::ostream& cout
			 , S::Bus& bus
			 , Ev::ThreadPool& threadpool
			 , Tn::Network& network
			 ) {
	auto all = std::make_shared<All>();

	/* Basic.  */
	all->install<JsonOutputter>(cout, bus);
	all->install<Logger>(bus);
	all->install<CommandReceiver>(bus);

	/* Network events.  */
	all->install<EventParser>(bus);
	all->install<EventIngester>(bus, network);

	/* Queries.  */
	all->install<PathQueryHandler>(bus, threadpool, network);
	all->install<InfoCommand>(bus, network);

	return all;
}

}}
