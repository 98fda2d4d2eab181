#pragma once

#include <bondcurve/controller/error.hpp>
#include <bondcurve/program.hpp>
#include <bondcurve/protocol.hpp>
#include <bondcurve/state_db.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace bondcurve::controller {

enum class intent : std::uint8_t
{
  read_only,
  operation_application
};

class execution_context final: public program::system_interface
{
public:
  execution_context()                           = delete;
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  execution_context( const program::bonding_curve& curve, intent i = intent::read_only );

  ~execution_context() final = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  void set_state_node( const state_db::state_node_ptr& );
  void clear_state_node();

  /**
   * Runs a single operation against the current state node. Events are
   * numbered in the order they were emitted.
   */
  result< protocol::receipt > apply( const protocol::operation& );

  std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) final;

  std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) final;

  std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) final;

  std::error_code emit_event( protocol::event&& e ) final;

private:
  const program::bonding_curve& _curve;
  state_db::state_node_ptr _state_node;
  std::vector< protocol::event > _events;
  intent _intent;
};

} // namespace bondcurve::controller
