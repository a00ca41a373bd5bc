#pragma once

#include <array>
#include <cstddef>
#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <vapp/encode.hpp>
#include <vapp/numeric/checked.hpp>

namespace vapp::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

// Addresses, digests and request ids are logged by value as hex.
template< std::size_t N >
hex hex_of( const std::array< std::byte, N >& bytes ) noexcept
{
  return hex{ bytes.data(), N };
}

// Amounts and indices are formatted in decimal on the backend thread.
struct amount
{
  numeric::uint256 value;
};

} // namespace vapp::log

template<>
struct fmtquill::formatter< vapp::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const vapp::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                vapp::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< vapp::log::hex >: quill::BinaryDataDeferredFormatCodec< vapp::log::hex >
{};

template<>
struct fmtquill::formatter< vapp::log::amount >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const vapp::log::amount& a, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", a.value.str() );
  }
};

template<>
struct quill::Codec< vapp::log::amount >: quill::DeferredFormatCodec< vapp::log::amount >
{};
