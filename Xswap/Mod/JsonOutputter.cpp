#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Xswap/Mod/JsonOutputter.hpp"
#include"Xswap/Msg/JsonCout.hpp"
#include"Xswap/concurrent.hpp"

namespace Xswap { namespace Mod {

JsonOutputter::JsonOutputter( std::ostream& out_
			    , S::Bus& bus
			    ) : out(out_), scheduled(false), lines(0) {
	bus.subscribe<Xswap::Msg::JsonCout>([this](Xswap::Msg::JsonCout const& j) {
		batch.push_back(j.obj.output());
		if (scheduled)
			return Ev::lift();
		scheduled = true;
		return Xswap::concurrent(flush());
	});
}

Ev::Io<void> JsonOutputter::flush() {
	return Ev::yield().then([this]() {
		auto pending = std::vector<std::string>();
		pending.swap(batch);
		scheduled = false;

		for (auto const& line : pending)
			out << line << '\n';
		out.flush();
		lines += pending.size();

		return Ev::lift();
	});
}

}}
