#include<Ev/Io.hpp>
#include<Ev/signal.hpp>
#include<Util/make_unique.hpp>
#include<ev.h>
#include<functional>
#include<memory>

namespace {

/* Shared by all the watchers of one Ev::signal call.  */
struct Watch {
	std::function<void(int)> pass;
	std::vector<std::unique_ptr<ev_signal>> watchers;
};

void signal_handler(EV_P_ ev_signal* raw, int) {
	/* Acquire responsibility.  */
	auto watch = std::unique_ptr<Watch>((Watch*) raw->data);
	for (auto& w : watch->watchers)
		ev_signal_stop(EV_A_ w.get());

	auto signum = raw->signum;
	auto pass = std::move(watch->pass);

	/* Release resources.  */
	watch = nullptr;

	pass(signum);
}

}

namespace Ev {

Io<int> signal(std::vector<int> signums) {
	return Io<int>([signums]( std::function<void(int)> pass
				, std::function<void(std::exception_ptr)> fail
				) {
		auto watch = Util::make_unique<Watch>();
		watch->pass = std::move(pass);
		for (auto s : signums) {
			auto w = Util::make_unique<ev_signal>();
			ev_signal_init(w.get(), &signal_handler, s);
			w->data = watch.get();
			watch->watchers.push_back(std::move(w));
		}
		/* Release responsibility to C code.  */
		auto raw = watch.release();
		for (auto& w : raw->watchers)
			ev_signal_start(EV_DEFAULT_ w.get());
	});
}

}
