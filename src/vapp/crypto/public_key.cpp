#include <vapp/crypto/public_key.hpp>
#include <vapp/memory.hpp>

#include <stdexcept>

#include <sodium.h>

namespace vapp::crypto {

namespace detail {

void initialize_sodium()
{
  static const int retcode = sodium_init();
  if( retcode < 0 )
    throw std::runtime_error( "unable to initialize libsodium" );
}

} // namespace detail

public_key::public_key( const public_key_data& bytes ) noexcept:
    _bytes( bytes )
{}

bool public_key::verify( const signature& sig, std::span< const std::byte > message ) const noexcept
{
  return crypto_sign_verify_detached( memory::c_bytes( sig ),
                                      memory::c_bytes( message ),
                                      message.size(),
                                      memory::c_bytes( _bytes ) )
         == 0;
}

const public_key_data& public_key::bytes() const noexcept
{
  return _bytes;
}

} // namespace vapp::crypto
