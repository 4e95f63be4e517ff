#include <vil/ledger/nullifier_registry.hpp>
#include <vil/ledger/exceptions.hpp>
#include <vil/db/level_map.hpp>

#include <fc/thread/mutex.hpp>
#include <fc/thread/scoped_lock.hpp>

#include <unordered_map>

namespace vil { namespace ledger {

namespace detail {
class nullifier_registry_impl {
public:
   db::level_database*                                       database = nullptr;
   db::level_map<nullifier_key, nullifier_record>           nullifier_db;

   fc::mutex                                                 scope_locks_mutex;
   std::unordered_map<string, std::shared_ptr<fc::mutex>>    scope_locks;

   std::shared_ptr<fc::mutex> lock_for( const string& scope )
   {
      fc::scoped_lock<fc::mutex> lock( scope_locks_mutex );
      auto& scope_lock = scope_locks[scope];
      if( !scope_lock )
         scope_lock = std::make_shared<fc::mutex>();
      return scope_lock;
   }

   void check_arguments( const string& scope, const nullifier_type& nullifier )const
   {
      FC_ASSERT( database != nullptr, "nullifier registry is not open" );
      if( scope.empty() )
         FC_THROW_EXCEPTION( validation_error, "nullifier scope must not be empty" );
      if( nullifier.empty() || nullifier.size() > VIL_MAX_NULLIFIER_SIZE )
         FC_THROW_EXCEPTION( validation_error, "nullifier must be between 1 and ${max} bytes",
                             ("max",VIL_MAX_NULLIFIER_SIZE)("scope",scope) );
   }

   void reserve( const string& scope, const nullifier_type& nullifier, const nullifier_registry::stage_function& stage )
   {
      check_arguments( scope, nullifier );

      auto scope_lock = lock_for( scope );
      fc::scoped_lock<fc::mutex> lock( *scope_lock );

      const nullifier_key key{ scope, nullifier };
      if( nullifier_db.contains( key ) )
         FC_THROW_EXCEPTION( nullifier_already_used, "nullifier already used in scope ${scope}", ("scope",scope) );

      db::write_batch batch;
      nullifier_db.store( key, nullifier_record{ scope, nullifier, fc::time_point::now() }, batch );
      if( stage )
         stage( batch );
      database->write( batch );
   }
};
} // namespace detail

nullifier_registry::nullifier_registry()
{
   my = std::make_shared<detail::nullifier_registry_impl>();
}

nullifier_registry::~nullifier_registry(){}

void nullifier_registry::open( db::level_database& database )
{
   FC_ASSERT( !is_open(), "Refusing to open already-opened nullifier registry." );
   my->nullifier_db.open( database, nullifier_table );
   my->database = &database;
}

bool nullifier_registry::is_open()const
{
   return my->database != nullptr;
}

void nullifier_registry::close()
{
   my->nullifier_db.close();
   my->database = nullptr;
}

void nullifier_registry::reserve( const string& scope, const nullifier_type& nullifier )
{
   my->reserve( scope, nullifier, stage_function() );
}

void nullifier_registry::reserve( const string& scope, const nullifier_type& nullifier, const stage_function& stage )
{
   my->reserve( scope, nullifier, stage );
}

bool nullifier_registry::query( const string& scope, const nullifier_type& nullifier )const
{
   my->check_arguments( scope, nullifier );
   return my->nullifier_db.contains( nullifier_key{ scope, nullifier } );
}

optional<nullifier_record> nullifier_registry::get_record( const string& scope, const nullifier_type& nullifier )const
{
   my->check_arguments( scope, nullifier );
   return my->nullifier_db.fetch_optional( nullifier_key{ scope, nullifier } );
}

} } // vil::ledger
