#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ios>
#include <new>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/serialization/array.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/std_optional.hpp>
#include <boost/serialization/variant.hpp>
#include <boost/serialization/vector.hpp>

namespace vapp::protocol {

template< typename T >
std::vector< std::byte > to_binary( const T& t )
{
  std::ostringstream stream( std::ios::binary );
  {
    boost::archive::binary_oarchive oa( stream );
    oa << t;
  }

  auto str = stream.str();
  std::vector< std::byte > bytes( str.size() );
  for( std::size_t i = 0; i < str.size(); ++i )
    bytes[ i ] = static_cast< std::byte >( str[ i ] );

  return bytes;
}

/*
 * Returns nullopt when the bytes are not a complete archive of T. Boost reports malformed
 * input through archive_exception and truncated input through std::ios failures. A
 * collection count larger than memory allows surfaces as length_error or bad_alloc.
 */
template< typename T >
std::optional< T > from_binary( std::span< const std::byte > bytes )
{
  std::string str( bytes.size(), '\0' );
  for( std::size_t i = 0; i < bytes.size(); ++i )
    str[ i ] = static_cast< char >( bytes[ i ] );

  std::istringstream stream( str, std::ios::binary );

  try
  {
    boost::archive::binary_iarchive ia( stream );
    T t{};
    ia >> t;
    return t;
  }
  catch( const boost::archive::archive_exception& )
  {
    return std::nullopt;
  }
  catch( const std::ios_base::failure& )
  {
    return std::nullopt;
  }
  catch( const std::length_error& )
  {
    return std::nullopt;
  }
  catch( const std::bad_alloc& )
  {
    return std::nullopt;
  }
}

} // namespace vapp::protocol
