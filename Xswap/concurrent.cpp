#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Xswap/Shutdown.hpp"
#include"Xswap/concurrent.hpp"

namespace {

Ev::Io<void> stopped(Xswap::Shutdown const&) {
	/* The greenthread simply ends.  */
	return Ev::lift();
}

}

namespace Xswap {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	auto quiet = io.catching<Xswap::Shutdown>(&stopped);
	return Ev::concurrent(std::move(quiet));
}

}
