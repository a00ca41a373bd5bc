#include <vapp/verifier/verifier.hpp>

#include <span>

#include <boost/endian/conversion.hpp>

#include <vapp/memory.hpp>

namespace vapp::verifier {

result< void > mock_verifier::verify( const vk_digest&, const pv_digest& ) const
{
  return {};
}

result< void > reject_verifier::verify( const vk_digest&, const pv_digest& ) const
{
  return std::unexpected( verifier_errc::invalid_proof );
}

vk_digest to_vk_digest( const crypto::digest& bytes ) noexcept
{
  vk_digest words{};
  std::span< const std::byte > remaining( bytes );
  for( auto& word: words )
  {
    word      = boost::endian::load_big_u32( memory::c_bytes( remaining ) );
    remaining = remaining.subspan( sizeof( std::uint32_t ) );
  }

  return words;
}

crypto::digest from_vk_digest( const vk_digest& words ) noexcept
{
  crypto::digest bytes{};
  std::span< std::byte > remaining( bytes );
  for( auto word: words )
  {
    boost::endian::store_big_u32( memory::c_writable_bytes( remaining ), word );
    remaining = remaining.subspan( sizeof( std::uint32_t ) );
  }

  return bytes;
}

} // namespace vapp::verifier
