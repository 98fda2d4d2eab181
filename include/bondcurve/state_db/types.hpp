#pragma once

#include <cstdint>
#include <memory>

namespace bondcurve::state_db {

class state_node;
class permanent_state_node;
class temporary_state_node;
class state_delta;

struct object_space
{
  std::uint32_t id = 0;
};

using state_node_ptr           = std::shared_ptr< state_node >;
using permanent_state_node_ptr = std::shared_ptr< permanent_state_node >;
using temporary_state_node_ptr = std::shared_ptr< temporary_state_node >;

} // namespace bondcurve::state_db
