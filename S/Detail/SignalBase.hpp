#ifndef S_DETAIL_SIGNALBASE_HPP
#define S_DETAIL_SIGNALBASE_HPP

namespace S { namespace Detail {

/* Type-erased base so that S::Bus can own signals of
 * any message type.  */
class SignalBase {
public:
	virtual ~SignalBase() { }
};

}}

#endif /* !defined(S_DETAIL_SIGNALBASE_HPP) */
