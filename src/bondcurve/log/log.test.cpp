// NOLINTBEGIN

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <stdexcept>

#include <quill/core/LogLevel.h>

#include <bondcurve/log.hpp>

TEST( log, set_level )
{
  bondcurve::log::initialize();

  bondcurve::log::set_level( "debug" );
  EXPECT_EQ( bondcurve::log::instance()->get_log_level(), quill::LogLevel::Debug );

  bondcurve::log::set_level( "warning" );
  EXPECT_EQ( bondcurve::log::instance()->get_log_level(), quill::LogLevel::Warning );

  EXPECT_THROW( bondcurve::log::set_level( "loud" ), std::exception );
  EXPECT_EQ( bondcurve::log::instance()->get_log_level(), quill::LogLevel::Warning );

  bondcurve::log::set_level( "info" );
}

TEST( log, formatters )
{
  bondcurve::numeric::uint128 amount( "340282366920938463463374607431768211455" );
  EXPECT_EQ( fmtquill::format( "{}", amount ), "340282366920938463463374607431768211455" );
  EXPECT_EQ( fmtquill::format( "{}", bondcurve::numeric::uint128( 0 ) ), "0" );

  std::array< std::byte, 3 > bytes{ std::byte{ 0x00 }, std::byte{ 0xab }, std::byte{ 0x10 } };
  EXPECT_EQ( fmtquill::format( "{}", bondcurve::log::hex{ bytes.data(), bytes.size() } ), "0x00ab10" );
}

// NOLINTEND
