#pragma once

#include <bondcurve/state_db/error.hpp>
#include <bondcurve/state_db/state_delta.hpp>
#include <bondcurve/state_db/state_node.hpp>

#include <filesystem>
#include <optional>
#include <system_error>

namespace bondcurve::state_db {

/**
 * database holds a single committed root state and hands out temporary
 * children of it for staged writes.
 *
 * When opened with a path the committed state is mirrored to a snapshot file
 * in that directory. A commit writes the merged state of the child to a
 * temporary file and renames it over the snapshot before squashing the child
 * in to the root, so the snapshot on disk is always either the state before
 * or the state after a commit.
 *
 * database is not thread safe. Callers serialize writers and must not read
 * while a commit is in progress.
 */
class database final
{
public:
  database() noexcept;
  database( const database& ) = delete;
  database( database&& )      = delete;
  ~database();

  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;

  /**
   * Open the database, loading the snapshot under path if one exists.
   */
  std::error_code open( const std::optional< std::filesystem::path >& path = {} );

  /**
   * Close the database.
   */
  void close();

  /**
   * Discard all committed state, including the snapshot on disk.
   */
  std::error_code reset();

  /**
   * Persist and squash a direct child of head in to head.
   *
   * On failure the child is left untouched and head is unchanged.
   */
  std::error_code commit( const temporary_state_node_ptr& node );

  /**
   * Get and return the current "head" node.
   *
   * Return an empty pointer if the database is not open.
   */
  permanent_state_node_ptr head() const;

  bool is_open() const;

private:
  std::optional< std::filesystem::path > snapshot_file() const;
  std::error_code load_snapshot( const std::filesystem::path& file );
  std::error_code write_snapshot( const state_delta::object_map& objects, std::uint64_t revision ) const;

  std::shared_ptr< state_delta > _root;
  permanent_state_node_ptr _head;
  std::optional< std::filesystem::path > _path;
};

} // namespace bondcurve::state_db
