#ifndef S_DETAIL_SIGNAL_HPP
#define S_DETAIL_SIGNAL_HPP

#include"Ev/Io.hpp"
#include"Ev/foreach.hpp"
#include"S/Detail/SignalBase.hpp"
#include<functional>
#include<memory>
#include<vector>

namespace S { namespace Detail {

/* The subscribers of one message type.  */
template<typename a>
class Signal : public SignalBase {
public:
	typedef std::function<Ev::Io<void>(a const&)> Handler;

private:
	std::vector<Handler> handlers;

public:
	void subscribe(Handler h) {
		if (h)
			handlers.push_back(std::move(h));
	}

	/* Handlers subscribed while this runs do not see
	 * this message.  */
	Ev::Io<void> raise(a value) {
		auto msg = std::make_shared<a>(std::move(value));
		return Ev::foreach([msg](Handler h) {
			return h(*msg);
		}, handlers);
	}
};

}}

#endif /* !defined(S_DETAIL_SIGNAL_HPP) */
