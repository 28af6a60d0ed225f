#ifndef XSWAP_MSG_JSONCOUT_HPP
#define XSWAP_MSG_JSONCOUT_HPP

#include"Json/Out.hpp"

namespace Xswap { namespace Msg {

/** struct Xswap::Msg::JsonCout
 *
 * @brief a JSON object to be written as one line
 * on the feed output.
 */
struct JsonCout {
	Json::Out obj;
};

}}

#endif /* !defined(XSWAP_MSG_JSONCOUT_HPP) */
