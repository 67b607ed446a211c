#ifndef EV_THREADPOOL_HPP
#define EV_THREADPOOL_HPP

#include"Ev/Io.hpp"
#include<cstddef>
#include<functional>
#include<memory>

namespace Ev {

/** class Ev::ThreadPool
 *
 * @brief runs functions on background threads and resumes
 * the waiting greenthread on the main thread once they
 * complete.
 *
 * @desc blocking reads of the input stream and path
 * queries both go through here, so the event loop keeps
 * accepting network events while queries execute.
 */
class ThreadPool {
public:
	/* Runs on a worker thread and returns the continuation
	 * to run back on the main thread.  */
	typedef std::function<std::function<void()>()> Job;

private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	void submit(Job job);

	template<typename a>
	static
	Job make_job( std::shared_ptr<std::function<a()>> func
		    , std::function<void(a)> pass
		    , std::function<void(std::exception_ptr)> fail
		    ) {
		return [func, pass, fail]() -> std::function<void()> {
			try {
				auto res = std::make_shared<a>((*func)());
				return [pass, res]() { pass(std::move(*res)); };
			} catch (...) {
				auto e = std::current_exception();
				return [fail, e]() { fail(e); };
			}
		};
	}

public:
	explicit
	ThreadPool(std::size_t num_threads = 4);
	~ThreadPool();
	ThreadPool(ThreadPool const&) =delete;
	ThreadPool(ThreadPool&&) =delete;

	std::size_t size() const;

	template<typename a>
	Io<a> background(std::function<a()> func) {
		auto shared = std::make_shared<std::function<a()>>(
			std::move(func)
		);
		return Io<a>([shared, this]
			     ( std::function<void(a)> pass
			     , std::function<void(std::exception_ptr)> fail
			     ) {
			submit(make_job<a>(shared, pass, fail));
		});
	}
};

}

#endif /* EV_THREADPOOL_HPP */
