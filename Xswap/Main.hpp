#ifndef XSWAP_MAIN_HPP
#define XSWAP_MAIN_HPP

#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Xswap {

/** class Xswap::Main
 *
 * @brief the `xswapd` program: parses the command
 * line, assembles the modules and runs until
 * interrupted.
 *
 * @desc The feed goes to `cout`, logs to `cerr`.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() =delete;
	Main( std::vector<std::string> argv
	    , std::ostream& cout
	    , std::ostream& cerr
	    );
	Main(Main&&);
	~Main();

	Ev::Io<int> run();
};

}

#endif /* !defined(XSWAP_MAIN_HPP) */
