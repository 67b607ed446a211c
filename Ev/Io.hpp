#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<type_traits>

namespace Ev { template<typename a> class Io; }

namespace Ev { namespace Detail {

/* The a of an Io<a>.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> { typedef a type; };

/* Callback that receives the result of an Io<a>.  */
template<typename a>
struct PassFunc { typedef std::function<void(a)> type; };
template<>
struct PassFunc<void> { typedef std::function<void()> type; };

/* What a continuation of an Io<a> returns.  */
template<typename f, typename a>
struct ContinuationResult { typedef std::invoke_result_t<f, a> type; };
template<typename f>
struct ContinuationResult<f, void> { typedef std::invoke_result_t<f> type; };

}}

namespace Ev {

/** class Ev::Io<a>
 *
 * @brief an action that, when run, eventually yields
 * a value of type `a` or fails with an exception.
 *
 * @desc constructing an action does nothing until it
 * is run.
 * A module suspends by returning an action that
 * completes later from the main loop, so greenthreads
 * interleave only at the points where one of them
 * waits.
 */
template<typename a>
class Io {
public:
	typedef typename Detail::PassFunc<a>::type Pass;
	typedef std::function<void(std::exception_ptr)> Fail;
	typedef std::function<void(Pass, Fail)> CoreFunc;

private:
	CoreFunc core;

	template<typename b>
	friend class Io;

public:
	Io(CoreFunc core_) : core(std::move(core_)) { }

	/** Ev::Io<a>::then
	 *
	 * @brief sequence this action with `func`, which
	 * takes the result of this action (if any) and
	 * returns the next action to run.
	 *
	 * @desc a throw from `func` fails the combined
	 * action.
	 */
	template<typename f>
	Io<typename Detail::IoInner<
		typename Detail::ContinuationResult<f, a>::type
	>::type>
	then(f func) const {
		using b = typename Detail::IoInner<
			typename Detail::ContinuationResult<f, a>::type
		>::type;
		auto first = core;
		return Io<b>([first, func]( typename Io<b>::Pass pass
					  , Fail fail
					  ) {
			auto next = [func, pass, fail](auto&&... value) {
				try {
					func(std::move(value)...).core(pass, fail);
				} catch (...) {
					fail(std::current_exception());
				}
			};
			try {
				first(Pass(next), fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}

	/** Ev::Io<a>::catching<e>
	 *
	 * @brief if this action fails with an `e`, run the
	 * action `handler` returns for it instead.
	 *
	 * @desc failures of any other type pass through
	 * unchanged.
	 */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto attempt = core;
		return Io<a>([attempt, handler](Pass pass, Fail fail) {
			auto recover = [pass, fail, handler](std::exception_ptr ep) {
				auto fallback = std::unique_ptr<Io<a>>();
				try {
					std::rethrow_exception(ep);
				} catch (e const& ex) {
					try {
						fallback = std::make_unique<Io<a>>(
							handler(ex)
						);
					} catch (...) {
						fail(std::current_exception());
						return;
					}
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				fallback->run(pass, fail);
			};
			try {
				attempt(pass, recover);
			} catch (...) {
				recover(std::current_exception());
			}
		});
	}

	/* Exactly one of pass or fail is called, once.  */
	void run(Pass pass, Fail fail) const noexcept {
		auto done = std::make_shared<bool>(false);
		auto once_fail = [done, fail](std::exception_ptr ep) {
			if (*done)
				return;
			*done = true;
			fail(std::move(ep));
		};
		auto once_pass = [done, pass](auto&&... value) {
			if (*done)
				return;
			*done = true;
			pass(std::move(value)...);
		};
		try {
			core(Pass(once_pass), once_fail);
		} catch (...) {
			once_fail(std::current_exception());
		}
	}
};

template<typename a>
Io<a> lift(a val) {
	auto box = std::make_shared<a>(std::move(val));
	return Io<a>([box]( std::function<void(a)> pass
			  , std::function<void(std::exception_ptr)>
			  ) {
		pass(std::move(*box));
	});
}
inline
Io<void> lift() {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)>
			  ) {
		pass();
	});
}

/* Run a, then b.  */
inline
Io<void> operator+(Io<void> a, Io<void> b) {
	return a.then([b]() { return b; });
}
inline
Io<void>& operator+=(Io<void>& a, Io<void> b) {
	a = a + std::move(b);
	return a;
}

}

#endif /* !defined(EV_IO_HPP) */
