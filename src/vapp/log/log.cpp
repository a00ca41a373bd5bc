#include <vapp/log/log.hpp>

#include <chrono>
#include <string>

#include <quill/Backend.h>
#include <quill/backend/BackendOptions.h>
#include <quill/sinks/ConsoleSink.h>

namespace vapp::log {

void initialize( quill::LogLevel level ) noexcept
{
  constexpr auto sleep_duration = std::chrono::milliseconds{ 100 };

  quill::BackendOptions options;
  options.sleep_duration = sleep_duration;
  options.error_notifier = []( const std::string& err ) noexcept
  {
    LOG_ERROR( vapp::log::instance(), "Encountered backend logging error: {}", err );
  };

  quill::Backend::start( options );
  instance()->set_log_level( level );
}

logger* instance() noexcept
{
  static auto logger = frontend::create_or_get_logger(
    "root",
    frontend::create_or_get_sink< quill::ConsoleSink >( "console_sink_id_1" ),
    quill::PatternFormatterOptions{ "%(time) [%(thread_id)] %(short_source_location:<28) %(log_level_short_code:<2) "
                                    "%(tags)%(message)",
                                    "%Y-%m-%d %H:%M:%S.%Qms",
                                    quill::Timezone::GmtTime } );
  return logger;
}

std::optional< quill::LogLevel > level_from_string( std::string_view level ) noexcept
{
  if( level == "trace" )
    return quill::LogLevel::TraceL1;
  if( level == "debug" )
    return quill::LogLevel::Debug;
  if( level == "info" )
    return quill::LogLevel::Info;
  if( level == "warning" || level == "warn" )
    return quill::LogLevel::Warning;
  if( level == "error" )
    return quill::LogLevel::Error;
  if( level == "critical" )
    return quill::LogLevel::Critical;

  return std::nullopt;
}

} // namespace vapp::log
