#ifndef XSWAP_MOD_JSONOUTPUTTER_HPP
#define XSWAP_MOD_JSONOUTPUTTER_HPP

#include<cstddef>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Xswap { namespace Mod {

/** class Xswap::Mod::JsonOutputter
 *
 * @brief writes each `Xswap::Msg::JsonCout` as a
 * single line on the feed stream.
 *
 * @desc Lines raised in the same turn of the loop
 * are batched and written together, in the order
 * they were raised, then the stream is flushed.
 */
class JsonOutputter {
private:
	std::ostream& out;
	std::vector<std::string> batch;
	bool scheduled;
	std::size_t lines;

	Ev::Io<void> flush();

public:
	JsonOutputter( std::ostream& out
		     , S::Bus& bus
		     );

	std::size_t written() const { return lines; }
};

}}

#endif /* !defined(XSWAP_MOD_JSONOUTPUTTER_HPP) */
