#ifndef S_DETAIL_SIGNAL_HPP
#define S_DETAIL_SIGNAL_HPP

#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"S/Detail/SignalBase.hpp"
#include<cstddef>
#include<functional>
#include<memory>
#include<vector>

namespace S { namespace Detail {

/* Registers callbacks for a particular type a, and
 * broadcasts to all callbacks.  */
template<typename a>
class Signal : public SignalBase {
private:
	typedef std::function<Ev::Io<void>(a const&)> Callback;
	/* Shared so that subscriptions made during a raise
	 * do not invalidate the list being iterated.  */
	std::shared_ptr<std::vector<Callback>> callbacks;

	/* State of one raise: the value, and the number of
	 * callbacks that have not yet completed.  */
	struct RaiseData {
		a value;
		std::size_t running;
		std::exception_ptr exc;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;

		explicit
		RaiseData(a value_) : value(std::move(value_))
				    , running(0)
				    , exc(nullptr)
				    { }

		void finish_one() {
			--running;
			if (running != 0)
				return;
			if (exc)
				fail(exc);
			else
				pass();
		}
	};

public:
	Signal() : callbacks(std::make_shared<std::vector<Callback>>()) { }

	/* Each subscriber is run in its own greenthread; the
	 * returned action completes once all of them complete,
	 * failing with one of their exceptions if any failed.
	 */
	Ev::Io<void> raise(a value) {
		auto cbs = callbacks;
		auto pdata = std::make_shared<RaiseData>(std::move(value));
		return Ev::yield().then([cbs, pdata]() {
			if (cbs->empty())
				return Ev::lift();
			return Ev::Io<void>([ cbs
					    , pdata
					    ]( std::function<void()> pass
					     , std::function<void(std::exception_ptr)> fail
					     ) {
				pdata->pass = std::move(pass);
				pdata->fail = std::move(fail);
				pdata->running = cbs->size();
				auto const count = cbs->size();
				for (auto i = std::size_t(0); i < count; ++i) {
					auto cb = (*cbs)[i];
					auto act = Ev::lift().then([cb, pdata]() {
						return cb(pdata->value);
					});
					act.run([pdata]() {
						pdata->finish_one();
					}, [pdata](std::exception_ptr e) {
						pdata->exc = e;
						pdata->finish_one();
					});
				}
			});
		});
	}

	void subscribe(Callback callback) {
		if (!callback)
			return;
		auto ncbs = std::make_shared<std::vector<Callback>>(*callbacks);
		ncbs->push_back(std::move(callback));
		callbacks = std::move(ncbs);
	}
};

}}

#endif /* !defined(S_DETAIL_SIGNAL_HPP) */
