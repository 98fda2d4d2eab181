#include <bondcurve/protocol/error.hpp>

#include <string>
#include <utility>

namespace bondcurve::protocol {

struct _protocol_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "protocol";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< protocol_errc >( condition ) )
    {
      case protocol_errc::ok:
        return "ok"s;
      case protocol_errc::invalid_account:
        return "invalid account"s;
      case protocol_errc::malformed_event:
        return "malformed event"s;
      case protocol_errc::unexpected_event:
        return "unexpected event"s;
    }
    std::unreachable();
  }
};

const std::error_category& protocol_category() noexcept
{
  static _protocol_category category;
  return category;
}

std::error_code make_error_code( protocol_errc e )
{
  return std::error_code( static_cast< int >( e ), protocol_category() );
}

} // namespace bondcurve::protocol
