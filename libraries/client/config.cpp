#include <vil/client/config.hpp>

#include <fc/io/json.hpp>
#include <fc/log/file_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/variant_object.hpp>

namespace vil { namespace client {

namespace detail {

   /** file appenders may name relative files, those live under data_dir */
   void expand_log_paths( fc::logging_config& logging, const fc::path& data_dir )
   {
      for( fc::appender_config& appender : logging.appenders )
      {
         if( appender.type != "file" )
            continue;

         auto args = appender.args.as<fc::file_appender::config>();
         if( !args.filename.is_relative() )
            continue;
         args.filename = fc::absolute( data_dir / args.filename );
         appender.args = fc::variant( args );
      }
   }

} // namespace detail

ledger::ledger_options config::get_ledger_options()const
{
   ledger::ledger_options options;
   options.max_field_size = max_field_size;
   options.sync_writes    = sync_writes;
   return options;
}

fc::logging_config create_default_logging_config( const fc::path& data_dir )
{
   fc::file_appender::config ledger_log;
   ledger_log.filename          = fc::path( "logs" ) / "vil.log";
   ledger_log.flush             = true;
   ledger_log.rotate            = true;
   ledger_log.rotation_interval = fc::hours( 1 );
   ledger_log.rotation_limit    = fc::days( 7 );

   fc::logging_config cfg;
   cfg.appenders.push_back( fc::appender_config( "stderr", "console",
                                                 fc::mutable_variant_object()( "stream", "std_error" ) ) );
   cfg.appenders.push_back( fc::appender_config( "ledger", "file", fc::variant( ledger_log ) ) );

   fc::logger_config default_logger;
   default_logger.name  = "default";
   default_logger.level = fc::log_level::info;
   default_logger.appenders.push_back( "stderr" );
   default_logger.appenders.push_back( "ledger" );
   cfg.loggers.push_back( default_logger );

   ilog( "logging to ${file}", ("file",data_dir / ledger_log.filename) );
   return cfg;
}

config load_config( const fc::path& data_dir )
{ try {
   const fc::path config_file = data_dir / "config.json";

   config cfg;
   if( fc::exists( config_file ) )
      cfg = fc::json::from_file( config_file ).as<config>();
   else
      cfg.logging = create_default_logging_config( data_dir );

   FC_ASSERT( cfg.default_required_shares > 0, "default_required_shares must be at least 1" );
   FC_ASSERT( cfg.max_field_size > 0, "max_field_size must be at least 1" );

   fc::create_directories( data_dir );
   fc::json::save_to_file( cfg, config_file );

   detail::expand_log_paths( cfg.logging, data_dir );
   return cfg;
} FC_RETHROW_EXCEPTIONS( warn, "unable to load config file ${cfg}", ("cfg",data_dir/"config.json") ) }

} } // vil::client
