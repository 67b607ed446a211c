#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Pfs/Mod/CommandReceiver.hpp"
#include"Pfs/Msg/CommandFail.hpp"
#include"Pfs/Msg/CommandRequest.hpp"
#include"Pfs/Msg/CommandResponse.hpp"
#include"Pfs/Msg/JsonCin.hpp"
#include"Pfs/Msg/JsonCout.hpp"
#include"Pfs/Msg/Notification.hpp"
#include"Pfs/log.hpp"
#include"S/Bus.hpp"

namespace Pfs { namespace Mod {

CommandReceiver::Key CommandReceiver::key_of(Jsmn::Object const& id) {
	return Key(id.is_string(), id.direct_text());
}

CommandReceiver::CommandReceiver(S::Bus& bus_) : bus(bus_) {
	bus.subscribe<Msg::JsonCin>([this](Msg::JsonCin const& cin_msg) {
		auto& inp = cin_msg.obj;
		if ( !inp.is_object()
		  || !inp.has("method") || !inp["method"].is_string()
		   )
			return Pfs::log( bus, Warn
				       , "Ignoring input that is not "
					 "a JSON-RPC request."
				       );
		auto method = std::string(inp["method"]);
		/* Missing params reads as null.  */
		auto params = inp["params"];

		if (!inp.has("id")) {
			/* Notification.  Not concurrent: events
			 * must be applied in the order received.  */
			return bus.raise(Msg::Notification{
				method, params
			});
		}

		auto id = inp["id"];
		if (!id.is_number() && !id.is_string())
			return Pfs::log( bus, Warn
				       , "Ignoring %s request with "
					 "unusable id %s."
				       , method.c_str()
				       , id.direct_text().c_str()
				       );
		auto key = key_of(id);
		if (pendings.count(key) != 0)
			return Pfs::log( bus, Warn
				       , "Ignoring %s request: id %s "
					 "already in flight."
				       , method.c_str()
				       , id.direct_text().c_str()
				       );
		pendings.insert(key);

		auto act = bus.raise(Msg::CommandRequest{
			method, params, id
		}).then([this, key, id, method]() {
			if (pendings.count(key) == 0)
				return Ev::lift();
			return bus.raise(Msg::CommandFail{
				id, -32601,
				"Method not found: " + method,
				Json::Out::empty_object()
			});
		});
		return Ev::concurrent(act);
	});

	bus.subscribe<Msg::CommandResponse>([this](Msg::CommandResponse const& resp) {
		/* If not a pending command, ignore.  */
		auto it = pendings.find(key_of(resp.id));
		if (it == pendings.end())
			return Ev::lift();
		pendings.erase(it);

		auto js = Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", resp.id)
				.field("result", resp.response)
			.end_object()
			;
		return bus.raise(Msg::JsonCout{std::move(js)});
	});
	bus.subscribe<Msg::CommandFail>([this](Msg::CommandFail const& fail) {
		auto it = pendings.find(key_of(fail.id));
		if (it == pendings.end())
			return Ev::lift();
		pendings.erase(it);

		auto js = Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", fail.id)
				.start_object("error")
					.field("code", fail.code)
					.field("message", fail.message)
					.field("data", fail.data)
				.end_object()
			.end_object()
			;
		return bus.raise(Msg::JsonCout{std::move(js)});
	});
}

}}
