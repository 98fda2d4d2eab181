#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <bondcurve/encode.hpp>
#include <bondcurve/numeric/uint128.hpp>

namespace bondcurve::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

} // namespace bondcurve::log

template<>
struct fmtquill::formatter< bondcurve::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const bondcurve::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                bondcurve::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< bondcurve::log::hex >: quill::BinaryDataDeferredFormatCodec< bondcurve::log::hex >
{};

template<>
struct fmtquill::formatter< bondcurve::numeric::uint128 >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const bondcurve::numeric::uint128& amount, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", amount.str() );
  }
};

template<>
struct quill::Codec< bondcurve::numeric::uint128 >: quill::DeferredFormatCodec< bondcurve::numeric::uint128 >
{};
