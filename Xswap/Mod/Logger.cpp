#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include"Xswap/Mod/Logger.hpp"
#include"Xswap/Msg/Log.hpp"

namespace Xswap { namespace Mod {

Logger::Logger( S::Bus& bus
	      , std::ostream& out_
	      , LogLevel min_level_
	      ) : out(out_), min_level(min_level_) {
	bus.subscribe<Xswap::Msg::Log>([this](Xswap::Msg::Log const& l) {
		if (int(l.level) < int(min_level))
			return Ev::lift();
		auto js = Json::Out()
			.start_object()
				.field("time", Ev::now())
				.field("level", std::string(to_string(l.level)))
				.field("message", l.message)
			.end_object()
			;
		out << js.output() << std::endl;
		return Ev::lift();
	});
}

}}
