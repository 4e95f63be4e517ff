#include <boost/program_options.hpp>

#include <vil/client/config.hpp>
#include <vil/ledger/ledger_database.hpp>
#include <vil/ledger/exceptions.hpp>

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/variant_object.hpp>

#include <iostream>

namespace program_options = boost::program_options;
using namespace vil;

program_options::variables_map parse_option_variables( int argc, char** argv )
{
   program_options::options_description option_config("Usage");
   option_config.add_options()
         ("help", "Display this help message and exit")

         ("data-dir", program_options::value<std::string>(), "Set ledger data directory")
         ("scope", program_options::value<std::string>(), "Ledger scope (election id, or election/question)")

         ("list", "List every scope with recorded votes")
         ("snapshot", "Print the current root and vote count of --scope")
         ("snapshot-at", program_options::value<uint32_t>(), "Print the retained snapshot taken at this vote count")
         ("export", "Print the audit export of --scope, without encrypted votes")
         ("find", program_options::value<std::string>(), "Find the entry of --scope recorded with this nullifier")
         ("proof", program_options::value<uint32_t>(), "Print the inclusion proof of this position in --scope")
         ("verify", program_options::value<std::string>(), "Verify the inclusion proof stored in this JSON file")
         ;

   program_options::variables_map option_variables;
   try
   {
      program_options::store( program_options::command_line_parser(argc, argv).
                              options(option_config).run(), option_variables );
      program_options::notify( option_variables );
   }
   catch( program_options::error& cmdline_error )
   {
      std::cerr << "Error: " << cmdline_error.what() << "\n";
      std::cerr << option_config << "\n";
      exit(1);
   }

   if( option_variables.count("help") )
   {
      std::cout << option_config << "\n";
      exit(0);
   }

   return option_variables;
}

ledger::vote_ledger_ptr require_ledger( ledger::ledger_database& db, const program_options::variables_map& options )
{
   FC_ASSERT( options.count("scope"), "--scope is required" );
   const std::string scope = options["scope"].as<std::string>();
   auto ledger = db.find_ledger( scope );
   if( !ledger )
      FC_THROW_EXCEPTION( ledger::ledger_empty, "no votes were recorded for ${scope}", ("scope",scope) );
   return ledger;
}

void print( const fc::variant& v )
{
   std::cout << fc::json::to_pretty_string( v ) << "\n";
}

int main( int argc, char** argv )
{
   int result = 0;
   try
   {
      const auto options = parse_option_variables( argc, argv );

      fc::path data_dir = options.count("data-dir") ? fc::path( options["data-dir"].as<std::string>() )
                                                    : fc::app_path() / ".vil";
      data_dir = fc::absolute( data_dir );

      const client::config cfg = client::load_config( data_dir );
      fc::configure_logging( cfg.logging );

      ledger::ledger_database db;
      db.open( data_dir, cfg.get_ledger_options() );

      if( options.count("list") )
      {
         print( fc::variant( db.list_scopes() ) );
      }
      else if( options.count("snapshot") )
      {
         print( fc::variant( require_ledger( db, options )->get_snapshot() ) );
      }
      else if( options.count("snapshot-at") )
      {
         print( fc::variant( require_ledger( db, options )->get_snapshot_at( options["snapshot-at"].as<uint32_t>() ) ) );
      }
      else if( options.count("export") )
      {
         print( fc::variant( require_ledger( db, options )->export_public_entries() ) );
      }
      else if( options.count("find") )
      {
         auto located = require_ledger( db, options )->find_by_nullifier( options["find"].as<std::string>() );
         if( !located.valid() )
         {
            std::cerr << "No vote was recorded with that nullifier\n";
            result = 2;
         }
         else
         {
            fc::mutable_variant_object obj;
            obj( "position", located->position )
               ( "id", located->entry.id )
               ( "commitment", located->entry.commitment )
               ( "timestamp", located->entry.timestamp );
            print( fc::variant( obj ) );
         }
      }
      else if( options.count("proof") )
      {
         print( fc::variant( require_ledger( db, options )->get_proof( options["proof"].as<uint32_t>() ) ) );
      }
      else if( options.count("verify") )
      {
         const auto proof = fc::json::from_file( fc::path( options["verify"].as<std::string>() ) ).as<ledger::inclusion_proof>();
         fc::mutable_variant_object obj;
         obj( "valid", ledger::vote_ledger::verify( proof ) );
         if( options.count("scope") )
            obj( "known_root", require_ledger( db, options )->is_known_root( proof.root ) );
         print( fc::variant( obj ) );
      }
      else
      {
         std::cerr << "Nothing to do, see --help\n";
         result = 1;
      }

      db.close();
   }
   catch( const fc::exception& e )
   {
      std::cerr << "------------ error --------------\n"
                << e.to_detail_string() << "\n";
      wlog( "${e}", ("e", e.to_detail_string() ) );
      result = 1;
   }

   fc::configure_logging( fc::logging_config::default_config() );
   return result;
}
