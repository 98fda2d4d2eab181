#include <bondcurve/protocol/account.hpp>

#include <algorithm>

#include <bondcurve/encode.hpp>

namespace bondcurve::protocol {

result< account > account_from_hex( std::string_view sv )
{
  auto bytes = encode::from_hex( sv );
  if( !bytes )
    return std::unexpected( bytes.error() );

  if( bytes->size() != account_length )
    return std::unexpected( protocol_errc::invalid_account );

  account a{};
  std::ranges::copy( *bytes, a.begin() );
  return a;
}

std::string to_hex( const account& a )
{
  return encode::to_hex( a );
}

} // namespace bondcurve::protocol
