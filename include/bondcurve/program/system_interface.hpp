#pragma once

#include <bondcurve/program/error.hpp>
#include <bondcurve/protocol.hpp>

#include <cstdint>
#include <span>
#include <system_error>

namespace bondcurve::program {

/**
 * The engine's only window on the world. Objects are addressed by an object
 * space id and a key within that space.
 */
struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  /**
   * Returns the stored object, or an empty span when there is none. The span
   * is valid until the next write through this interface.
   */
  virtual std::span< const std::byte > get_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code
  put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value ) = 0;

  virtual std::error_code remove_object( std::uint32_t id, std::span< const std::byte > key ) = 0;

  virtual std::error_code emit_event( protocol::event&& e ) = 0;
};

} // namespace bondcurve::program
