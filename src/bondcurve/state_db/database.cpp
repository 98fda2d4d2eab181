#include <bondcurve/state_db/database.hpp>

#include <exception>
#include <fstream>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/vector.hpp>

namespace bondcurve::state_db {

namespace {

constexpr std::string_view snapshot_name = "state.bin";
constexpr std::string_view staging_name  = "state.bin.tmp";

} // namespace

database::database() noexcept = default;

database::~database()
{
  close();
}

std::error_code database::open( const std::optional< std::filesystem::path >& p )
{
  auto root = std::make_shared< state_delta >();

  if( p )
  {
    std::error_code ec;
    std::filesystem::create_directories( *p, ec );
    if( ec )
      return ec;
  }

  _root = root;
  _path = p;

  if( auto file = snapshot_file(); file && std::filesystem::exists( *file ) )
  {
    if( auto ec = load_snapshot( *file ); ec )
    {
      close();
      return ec;
    }
  }

  _head = std::make_shared< permanent_state_node >( _root );
  return {};
}

void database::close()
{
  _head.reset();
  _root.reset();
  _path.reset();
}

std::error_code database::reset()
{
  if( !is_open() )
    return state_db_errc::not_open;

  if( auto file = snapshot_file(); file )
  {
    std::error_code ec;
    std::filesystem::remove( *file, ec );
    if( ec )
      return ec;
  }

  _root->load( {}, 0 );
  return {};
}

std::error_code database::commit( const temporary_state_node_ptr& node )
{
  if( !is_open() )
    return state_db_errc::not_open;

  const state_node& child = *node;
  const auto& delta       = child.delta();

  if( delta->parent() != _root )
    return state_db_errc::detached_node;

  if( _path )
  {
    if( auto ec = write_snapshot( delta->merged_objects(), delta->revision() ); ec )
      return ec;
  }

  node->squash();
  return {};
}

permanent_state_node_ptr database::head() const
{
  return _head;
}

bool database::is_open() const
{
  return _root != nullptr;
}

std::optional< std::filesystem::path > database::snapshot_file() const
{
  if( !_path )
    return {};

  return *_path / snapshot_name;
}

std::error_code database::load_snapshot( const std::filesystem::path& file )
{
  std::ifstream ifs( file, std::ios::binary );
  if( !ifs )
    return state_db_errc::io_failure;

  state_delta::object_map objects;
  std::uint64_t revision = 0;

  try
  {
    boost::archive::binary_iarchive ia( ifs );
    ia >> revision;
    ia >> objects;
  }
  catch( const boost::archive::archive_exception& )
  {
    return state_db_errc::corrupt_snapshot;
  }
  catch( const std::exception& )
  {
    // A truncated or garbled length prefix surfaces as an allocation failure
    return state_db_errc::corrupt_snapshot;
  }

  _root->load( std::move( objects ), revision );
  return {};
}

std::error_code database::write_snapshot( const state_delta::object_map& objects, std::uint64_t revision ) const
{
  auto staging = *_path / staging_name;

  {
    std::ofstream ofs( staging, std::ios::binary | std::ios::trunc );
    if( !ofs )
      return state_db_errc::io_failure;

    try
    {
      boost::archive::binary_oarchive oa( ofs );
      oa << revision;
      oa << objects;
    }
    catch( const boost::archive::archive_exception& )
    {
      return state_db_errc::io_failure;
    }

    ofs.flush();
    if( !ofs )
      return state_db_errc::io_failure;
  }

  std::error_code ec;
  std::filesystem::rename( staging, *_path / snapshot_name, ec );
  return ec;
}

} // namespace bondcurve::state_db
