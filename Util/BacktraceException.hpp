#ifndef UTIL_BACKTRACE_EXCEPTION_HPP
#define UTIL_BACKTRACE_EXCEPTION_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#include<string>
#include<utility>

#if ENABLE_EXCEPTION_BACKTRACE
# include<sstream>
# include<vector>
# define UNW_LOCAL_ONLY
# include<libunwind.h>
#endif

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief A wrapper for an exception E which additionally
 * records the call stack at construction when the build
 * enables ENABLE_EXCEPTION_BACKTRACE.
 *
 * @desc Without backtraces this is a plain forwarding
 * wrapper.
 * With backtraces, the frames are captured with libunwind
 * when the exception is constructed and symbolized lazily
 * on the first call to `what()`.
 */
template<typename E>
class BacktraceException : public E {
#if !ENABLE_EXCEPTION_BACKTRACE
public:
	template<typename... As>
	BacktraceException(As&&... as) : E(std::forward<As>(as)...) { }

	char const* what() const noexcept override {
		return E::what();
	}
#else
private:
	struct Frame {
		unw_word_t ip;
		std::string name;
		unw_word_t offset;
	};
	std::vector<Frame> frames;
	mutable bool formatted = false;
	mutable std::string full_message;

	void capture() {
		unw_context_t context;
		unw_cursor_t cursor;
		unw_getcontext(&context);
		unw_init_local(&cursor, &context);
		while (unw_step(&cursor) > 0 && frames.size() < 64) {
			auto f = Frame();
			unw_get_reg(&cursor, UNW_REG_IP, &f.ip);
			char buf[256];
			if (unw_get_proc_name(&cursor, buf, sizeof(buf), &f.offset) == 0)
				f.name = buf;
			else
				f.offset = 0;
			frames.push_back(std::move(f));
		}
	}

public:
	template<typename... As>
	BacktraceException(As&&... as) : E(std::forward<As>(as)...) {
		capture();
	}

	char const* what() const noexcept override {
		if (!formatted) {
			formatted = true;
			auto os = std::ostringstream();
			os << E::what() << "\nBacktrace:\n";
			auto i = std::size_t(0);
			for (auto const& f : frames) {
				os << "#" << i++ << " 0x" << std::hex << f.ip
				   << std::dec << " "
				   ;
				if (f.name.empty())
					os << "??";
				else
					os << f.name << "+" << f.offset;
				os << "\n";
			}
			full_message = os.str();
		}
		return full_message.c_str();
	}
#endif
};

}

#endif /* UTIL_BACKTRACE_EXCEPTION_HPP */
