#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/yield.hpp"
#include"Pfs/JsonInput.hpp"
#include"Pfs/Main.hpp"
#include"Pfs/Mod/all.hpp"
#include"Pfs/Msg/Begin.hpp"
#include"Pfs/Msg/EndOfOptions.hpp"
#include"Pfs/Msg/ManifestOption.hpp"
#include"Pfs/Msg/Manifestation.hpp"
#include"Pfs/Msg/Option.hpp"
#include"S/Bus.hpp"
#include"Tn/Network.hpp"
#include<algorithm>
#include<stdexcept>
#include<utility>

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

namespace Pfs {

class Main::Impl {
private:
	std::istream& cin;
	std::ostream& cout;
	std::ostream& cerr;

	std::unique_ptr<S::Bus> bus;
	std::unique_ptr<Ev::ThreadPool> threadpool;
	std::unique_ptr<Tn::Network> network;
	std::unique_ptr<Pfs::JsonInput> jsoninput;
	std::shared_ptr<void> modules;

	int exit_code;
	std::string argv0;
	std::vector<std::string> args;
	std::vector<Msg::ManifestOption> options;

	void usage(std::ostream& os) {
		os << "Usage: " << argv0 << " [OPTIONS]" << std::endl
		   << std::endl
		   << "Reads channel events and path queries as "
		      "JSON-RPC 2.0, one per line, on stdin." << std::endl
		   << std::endl
		   << "Options:" << std::endl
		   << " --version, -V" << std::endl
		   << "    Show version." << std::endl
		   << " --help, -h" << std::endl
		   << "    Show this help." << std::endl
		   ;
		for (auto const& o : options) {
			os << " --" << o.name << "=VALUE"
			   << " (default " << o.default_value << ")"
			   << std::endl
			   << "    " << o.description << std::endl
			   ;
		}
		os << std::endl
		   << "Send bug reports to: " << PACKAGE_BUGREPORT << std::endl
		   ;
	}

	bool known_option(std::string const& name) const {
		return std::any_of( options.begin(), options.end()
				  , [&name](Msg::ManifestOption const& o) {
			return o.name == name;
		});
	}

	Ev::Io<bool> bad_usage(std::string const& msg) {
		cerr << argv0 << ": " << msg << std::endl;
		usage(cerr);
		exit_code = 1;
		return Ev::lift(false);
	}

	/* Returns false if the service should not start.  */
	Ev::Io<bool> process_args() {
		auto given = std::vector<std::pair<std::string, std::string>>();
		for (auto const& arg : args) {
			if (arg == "--version" || arg == "-V") {
				cout << PACKAGE_STRING << std::endl;
				return Ev::lift(false);
			}
			if (arg == "--help" || arg == "-h") {
				usage(cout);
				return Ev::lift(false);
			}
			if (arg.size() < 3 || arg.substr(0, 2) != "--")
				return bad_usage("Unrecognized argument: " + arg);
			auto eq = arg.find('=');
			auto name = arg.substr(2, eq - 2);
			if (!known_option(name))
				return bad_usage("Unrecognized option: --" + name);
			if (eq == std::string::npos)
				return bad_usage("Option --" + name + " needs a value");
			given.emplace_back(name, arg.substr(eq + 1));
		}

		auto act = Ev::lift();
		for (auto& g : given)
			act += bus->raise(Msg::Option{
				std::move(g.first), std::move(g.second)
			});
		return (act + bus->raise(Msg::EndOfOptions{})).then([]() {
			return Ev::lift(true);
		}).catching<std::invalid_argument>([this](std::invalid_argument const& e) {
			cerr << argv0 << ": Invalid option: " << e.what()
			     << std::endl;
			exit_code = 1;
			return Ev::lift(false);
		});
	}

public:
	Impl( std::vector<std::string> argv
	    , std::istream& cin_
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    ) : cin(cin_)
	      , cout(cout_)
	      , cerr(cerr_)
	      , exit_code(0)
	      {
		if (argv.empty())
			throw std::invalid_argument("Main: empty argv");
		argv0 = argv[0];
		args.assign(argv.begin() + 1, argv.end());
	}

	Ev::Io<int> run() {
		/* Build our components.  */
		bus = std::make_unique<S::Bus>();
		threadpool = std::make_unique<Ev::ThreadPool>();
		network = std::make_unique<Tn::Network>();
		modules = Pfs::Mod::all( cout
				       , *bus
				       , *threadpool
				       , *network
				       );
		bus->subscribe<Msg::ManifestOption>([this](Msg::ManifestOption const& o) {
			options.push_back(o);
			return Ev::lift();
		});

		return Ev::yield().then([this]() {
			return bus->raise(Msg::Manifestation{});
		}).then([this]() {
			return process_args();
		}).then([this](bool proceed) {
			if (!proceed)
				return Ev::lift(exit_code);
			jsoninput = std::make_unique<Pfs::JsonInput>(
				*threadpool, cin, *bus
			);
			return bus->raise(Msg::Begin{}).then([this]() {
				/* Main loop.  */
				return jsoninput->run().catching<std::exception>([this](std::exception const& e) {
					cerr << "Uncaught exception: " << e.what()
					     << std::endl;
					exit_code = 1;
					return Ev::lift();
				});
			}).then([this]() {
				return Ev::lift(exit_code);
			});
		});
	}
};

Main::Main( std::vector<std::string> argv
	  , std::istream& cin
	  , std::ostream& cout
	  , std::ostream& cerr
	  ) : pimpl(std::make_unique<Impl>( std::move(argv)
					  , cin
					  , cout
					  , cerr
					  ))
	    { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

Ev::Io<int> Main::run() {
	return pimpl->run();
}

}
