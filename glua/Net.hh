#pragma once

#include <string>
#include <vector>

#include "State.hh"

namespace GLua {

/**
 * Registers each name with `util.AddNetworkString`. Server realm only. Errors
 * raised by the call are not caught; see `State::call`.
 */
void addNetworkStrings(State state, const std::vector<std::string>& names);

/** `net.Receive(name, func)` */
void receive(State state, const std::string& name, glua_CFunction func);

} // namespace GLua
