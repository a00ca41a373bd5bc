#include <vapp/crypto/secret_key.hpp>
#include <vapp/memory.hpp>

#include <stdexcept>

#include <sodium.h>

namespace vapp::crypto {

secret_key secret_key::create()
{
  detail::initialize_sodium();

  secret_key key;
  if( crypto_sign_keypair( memory::c_writable_bytes( key._public_bytes ),
                           memory::c_writable_bytes( key._secret_bytes ) ) )
    throw std::runtime_error( "key generation failed" );

  return key;
}

secret_key secret_key::create( const digest& seed )
{
  static_assert( std::tuple_size_v< digest > == crypto_sign_SEEDBYTES );

  detail::initialize_sodium();

  secret_key key;
  if( crypto_sign_seed_keypair( memory::c_writable_bytes( key._public_bytes ),
                                memory::c_writable_bytes( key._secret_bytes ),
                                memory::c_bytes( seed ) ) )
    throw std::runtime_error( "seeded key generation failed" );

  return key;
}

signature secret_key::sign( std::span< const std::byte > message ) const
{
  signature sig{};
  if( crypto_sign_detached( memory::c_writable_bytes( sig ),
                            nullptr,
                            memory::c_bytes( message ),
                            message.size(),
                            memory::c_bytes( _secret_bytes ) ) )
    throw std::runtime_error( "signing failed" );

  return sig;
}

public_key secret_key::public_key() const noexcept
{
  return crypto::public_key( _public_bytes );
}

const secret_key_data& secret_key::bytes() const noexcept
{
  return _secret_bytes;
}

} // namespace vapp::crypto
