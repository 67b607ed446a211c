#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Pfs/JsonInput.hpp"
#include"Pfs/Msg/JsonCin.hpp"
#include"Pfs/Msg/JsonCout.hpp"
#include"Pfs/log.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include<string>

namespace Pfs {

class JsonInput::Impl {
private:
	Ev::ThreadPool& threadpool;
	std::istream& cin;
	S::Bus& bus;

	Ev::Io<void> handle(std::string const& line) {
		if (Util::Str::trim(line).empty())
			return Ev::lift();
		auto obj = Jsmn::Object();
		try {
			obj = Jsmn::Parser::parse(line);
		} catch (Jsmn::ParseError const& e) {
			auto js = Json::Out()
				.start_object()
					.field("jsonrpc", std::string("2.0"))
					.field("id", nullptr)
					.start_object("error")
						.field("code", -32700)
						.field("message", std::string(e.what()))
					.end_object()
				.end_object()
				;
			return Pfs::log( bus, Warn
				       , "Ignoring unparseable input: %s"
				       , e.what()
				       )
			     + bus.raise(Msg::JsonCout{std::move(js)})
			     ;
		}
		return bus.raise(Msg::JsonCin{std::move(obj)});
	}

public:
	Impl( Ev::ThreadPool& threadpool_
	    , std::istream& cin_
	    , S::Bus& bus_
	    ) : threadpool(threadpool_)
	      , cin(cin_)
	      , bus(bus_)
	      { }

	Ev::Io<void> run() {
		return threadpool.background<std::unique_ptr<std::string>>([this]() {
			auto line = std::string();
			if (!std::getline(cin, line))
				return std::unique_ptr<std::string>();
			return std::make_unique<std::string>(std::move(line));
		}).then([this](std::unique_ptr<std::string> pline) {
			if (!pline)
				/* Exit loop.  */
				return Ev::lift();
			return handle(*pline)
			     + run()
			     ;
		});
	}
};

JsonInput::JsonInput( Ev::ThreadPool& threadpool
		    , std::istream& cin
		    , S::Bus& bus
		    ) : pimpl(std::make_unique<Impl>(threadpool, cin, bus)) { }
JsonInput::~JsonInput() { }
JsonInput::JsonInput(JsonInput&& o) : pimpl(std::move(o.pimpl)) { }

Ev::Io<void> JsonInput::run() {
	return pimpl->run();
}

}
