#include"Ev/ThreadPool.hpp"
#include<condition_variable>
#include<deque>
#include<ev.h>
#include<mutex>
#include<signal.h>
#include<thread>
#include<vector>

namespace Ev {

class ThreadPool::Impl {
private:
	std::vector<std::thread> workers;

	/* Main thread only, except that workers may
	 * ev_async_send to wakeup on loop.  */
	struct ev_loop* loop;
	ev_async wakeup;
	/* Jobs submitted whose continuations have not run.
	 * The wakeup watcher is active only while nonzero, so
	 * an idle pool does not keep the loop running.  */
	std::size_t outstanding;

	/* Guarded by mtx.  */
	std::mutex mtx;
	std::condition_variable jobs_cnd;
	bool stopping;
	std::deque<Job> jobs;
	std::deque<std::function<void()>> done;

	void worker() {
		auto lock = std::unique_lock<std::mutex>(mtx);
		for (;;) {
			jobs_cnd.wait(lock, [this]() {
				return stopping || !jobs.empty();
			});
			if (stopping)
				return;
			auto job = std::move(jobs.front());
			jobs.pop_front();

			lock.unlock();
			auto k = job();
			job = nullptr;
			lock.lock();

			done.emplace_back(std::move(k));
			ev_async_send(loop, &wakeup);
		}
	}

	void on_wakeup(EV_P) {
		auto ready = std::deque<std::function<void()>>();
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			ready.swap(done);
		}

		outstanding -= ready.size();
		if (outstanding == 0)
			ev_async_stop(EV_A_ &wakeup);

		for (auto& k : ready)
			k();
	}
	static
	void on_wakeup_static(EV_P_ ev_async* w, int) {
		((Impl*) w->data)->on_wakeup(EV_A);
	}

public:
	explicit
	Impl(std::size_t num_threads) : loop(EV_DEFAULT)
				       , outstanding(0)
				       , stopping(false) {
		ev_async_init(&wakeup, &on_wakeup_static);
		wakeup.data = this;

		if (num_threads == 0)
			num_threads = 1;

		/* Workers never handle signals: they start with
		 * everything blocked, and the mask of this thread is
		 * put back afterwards.  */
		sigset_t all;
		sigset_t saved;
		sigfillset(&all);
		pthread_sigmask(SIG_SETMASK, &all, &saved);
		for (auto i = std::size_t(0); i < num_threads; ++i)
			workers.emplace_back([this]() { worker(); });
		pthread_sigmask(SIG_SETMASK, &saved, nullptr);
	}
	~Impl() {
		if (ev_is_active(&wakeup))
			ev_async_stop(loop, &wakeup);
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			stopping = true;
		}
		jobs_cnd.notify_all();
		for (auto& t : workers)
			t.join();
	}

	std::size_t size() const { return workers.size(); }

	void submit(Job job) {
		if (outstanding++ == 0)
			ev_async_start(loop, &wakeup);
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			jobs.emplace_back(std::move(job));
		}
		jobs_cnd.notify_one();
	}
};

ThreadPool::ThreadPool(std::size_t num_threads)
	: pimpl(std::make_unique<Impl>(num_threads)) { }
ThreadPool::~ThreadPool() { }

std::size_t ThreadPool::size() const { return pimpl->size(); }

void ThreadPool::submit(Job job) { pimpl->submit(std::move(job)); }

}
