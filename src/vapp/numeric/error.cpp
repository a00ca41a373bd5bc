#include <vapp/numeric/error.hpp>

#include <string>
#include <utility>

namespace vapp::numeric {

struct _numeric_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "numeric";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< numeric_errc >( condition ) )
    {
      case numeric_errc::ok:
        return "ok"s;
      case numeric_errc::overflow:
        return "arithmetic overflow"s;
    }
    std::unreachable();
  }
};

const std::error_category& numeric_category() noexcept
{
  static _numeric_category category;
  return category;
}

std::error_code make_error_code( numeric_errc e )
{
  return std::error_code( static_cast< int >( e ), numeric_category() );
}

} // namespace vapp::numeric
