#ifndef XSWAP_MSG_INIT_HPP
#define XSWAP_MSG_INIT_HPP

namespace Xswap { namespace Msg {

/** struct Xswap::Msg::Init
 *
 * @brief emitted once every module is constructed
 * and the coordinator has subscribed to its chains.
 */
struct Init { };

}}

#endif /* !defined(XSWAP_MSG_INIT_HPP) */
