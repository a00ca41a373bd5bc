#include <vapp/verifier/error.hpp>

#include <string>
#include <utility>

namespace vapp::verifier {

struct _verifier_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "verifier";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< verifier_errc >( condition ) )
    {
      case verifier_errc::ok:
        return "ok"s;
      case verifier_errc::invalid_proof:
        return "proof rejected by verifier"s;
    }
    std::unreachable();
  }
};

const std::error_category& verifier_category() noexcept
{
  static _verifier_category category;
  return category;
}

std::error_code make_error_code( verifier_errc e )
{
  return std::error_code( static_cast< int >( e ), verifier_category() );
}

} // namespace vapp::verifier
