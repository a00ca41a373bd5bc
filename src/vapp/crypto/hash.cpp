#include <vapp/crypto/hash.hpp>
#include <vapp/memory.hpp>

namespace vapp::crypto {

hasher::hasher() noexcept
{
  blake3_hasher_init( &_state );
}

hasher& hasher::update( const void* ptr, std::size_t len ) noexcept
{
  blake3_hasher_update( &_state, ptr, len );
  return *this;
}

hasher& hasher::update( std::string_view sv ) noexcept
{
  return update( sv.data(), sv.size() );
}

hasher& hasher::update( const char* s ) noexcept
{
  return update( std::string_view( s ) );
}

digest hasher::finalize() const noexcept
{
  digest out;
  blake3_hasher_finalize( &_state, memory::c_writable_bytes( out ), out.size() );
  return out;
}

digest hash( const void* ptr, std::size_t len ) noexcept
{
  return hasher().update( ptr, len ).finalize();
}

} // namespace vapp::crypto
