#include <vil/ledger/ledger_database.hpp>
#include <vil/ledger/exceptions.hpp>
#include <vil/db/level_map.hpp>

#include <fc/thread/mutex.hpp>
#include <fc/thread/scoped_lock.hpp>

#include <map>

namespace vil { namespace ledger {

namespace detail {
class ledger_database_impl {
public:
   db::level_database                       database;
   nullifier_registry                       nullifiers;
   ledger_options                           options;

   mutable fc::mutex                        ledgers_mutex;
   std::map<string, vote_ledger_ptr>        ledgers;

   ~ledger_database_impl()
   {
      if( database.is_open() )
         close();
   }

   vote_ledger_ptr load_ledger( const string& scope )
   {
      auto ledger = std::make_shared<vote_ledger>( scope, database, nullifiers, options.max_field_size );
      ledger->load();
      ledgers[scope] = ledger;
      return ledger;
   }

   void open( const fc::path& data_dir, const ledger_options& opts )
   {
      FC_ASSERT( !database.is_open(), "Refusing to open already-opened ledger database." );

      options = opts;
      database.open( data_dir / "ledger_db" );
      database.set_sync_writes( options.sync_writes );
      nullifiers.open( database );

      db::level_map<string, ledger_snapshot> head_db;
      head_db.open( database, head_table );

      fc::scoped_lock<fc::mutex> lock( ledgers_mutex );
      for( auto itr = head_db.begin(); itr.valid(); ++itr )
         load_ledger( itr.key() );

      ilog( "opened ledger database ${dir} with ${n} scopes", ("dir",data_dir)("n",ledgers.size()) );
   }

   void close()
   {
      fc::scoped_lock<fc::mutex> lock( ledgers_mutex );
      ledgers.clear();
      nullifiers.close();
      database.close();
   }
};
} // namespace detail

ledger_database::ledger_database()
{
   my = std::make_shared<detail::ledger_database_impl>();
}

ledger_database::~ledger_database(){}

void ledger_database::open( const fc::path& data_dir, const ledger_options& options )
{ try {
   my->open( data_dir, options );
} FC_CAPTURE_AND_RETHROW( (data_dir)(options) ) }

bool ledger_database::is_open()const
{
   return my->database.is_open();
}

void ledger_database::close()
{
   FC_ASSERT( is_open(), "Cannot close unopened ledger database." );
   my->close();
}

vote_ledger_ptr ledger_database::get_ledger( const string& scope )
{
   FC_ASSERT( is_open() );
   if( scope.empty() )
      FC_THROW_EXCEPTION( validation_error, "ledger scope must not be empty" );

   fc::scoped_lock<fc::mutex> lock( my->ledgers_mutex );
   auto itr = my->ledgers.find( scope );
   if( itr != my->ledgers.end() )
      return itr->second;
   return my->load_ledger( scope );
}

vote_ledger_ptr ledger_database::find_ledger( const string& scope )const
{
   fc::scoped_lock<fc::mutex> lock( my->ledgers_mutex );
   auto itr = my->ledgers.find( scope );
   if( itr == my->ledgers.end() || itr->second->get_vote_count() == 0 )
      return vote_ledger_ptr();
   return itr->second;
}

vector<string> ledger_database::list_scopes()const
{
   fc::scoped_lock<fc::mutex> lock( my->ledgers_mutex );
   vector<string> results;
   for( const auto& item : my->ledgers )
      if( item.second->get_vote_count() > 0 )
         results.push_back( item.first );
   return results;
}

nullifier_registry& ledger_database::nullifiers()
{
   return my->nullifiers;
}

} } // vil::ledger
