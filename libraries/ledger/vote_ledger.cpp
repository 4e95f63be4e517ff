#include <vil/ledger/vote_ledger.hpp>
#include <vil/ledger/merkle_tree.hpp>
#include <vil/ledger/exceptions.hpp>
#include <vil/db/level_map.hpp>

#include <fc/thread/mutex.hpp>
#include <fc/thread/scoped_lock.hpp>

#include <unordered_map>
#include <unordered_set>

namespace vil { namespace ledger {

namespace detail {
class vote_ledger_impl {
public:
   string                                            scope;
   nullifier_registry&                               nullifiers;
   uint32_t                                          max_field_size;

   db::level_map<entry_key, vote_entry>              entry_db;
   db::level_map<snapshot_key, ledger_snapshot>      snapshot_db;
   db::level_map<string, ledger_snapshot>            head_db;

   /** guards everything below; held for the whole of an append */
   mutable fc::mutex                                 state_mutex;
   merkle_tree                                       tree;
   std::unordered_map<nullifier_type, uint32_t>      nullifier_index;
   std::unordered_map<digest_type, uint32_t>         root_index;
   std::unordered_set<string>                        id_index;

   vote_ledger_impl( const string& scope, db::level_database& database,
                     nullifier_registry& nullifiers, uint32_t max_field_size )
      : scope(scope), nullifiers(nullifiers), max_field_size(max_field_size)
   {
      entry_db.open( database, entry_table );
      snapshot_db.open( database, snapshot_table );
      head_db.open( database, head_table );
   }

   void update_index( const vote_entry& entry, uint32_t position )
   {
      nullifier_index[entry.nullifier] = position;
      id_index.insert( entry.id );
      root_index.emplace( tree.root(), position + 1 );
   }

   void load()
   {
      fc::scoped_lock<fc::mutex> lock( state_mutex );

      tree.clear();
      nullifier_index.clear();
      root_index.clear();
      id_index.clear();
      root_index.emplace( merkle_tree::empty_root(), 0 );

      const optional<ledger_snapshot> head = head_db.fetch_optional( scope );
      if( !head.valid() )
         return;

      for( uint32_t position = 0; position < head->vote_count; ++position )
      {
         const vote_entry entry = entry_db.fetch( entry_key{ scope, position } );
         tree.append( entry.leaf_hash() );
         update_index( entry, position );
      }

      if( tree.root() != head->root )
         FC_THROW_EXCEPTION( ledger_corrupted, "ledger ${scope} rebuilt to root ${actual} but ${expected} was recorded",
                             ("scope",scope)("actual",tree.root())("expected",head->root)("vote_count",head->vote_count) );

      ilog( "loaded ledger ${scope} with ${n} votes, root ${root}",
            ("scope",scope)("n",head->vote_count)("root",head->root) );
   }

   append_result append( const vote_entry& entry )
   {
      entry.validate( max_field_size );

      fc::scoped_lock<fc::mutex> lock( state_mutex );

      const uint32_t position = tree.size();
      FC_ASSERT( position < VIL_MAX_LEDGER_ENTRIES, "ledger ${scope} is full", ("scope",scope) );
      if( id_index.find( entry.id ) != id_index.end() )
         FC_THROW_EXCEPTION( validation_error, "entry id ${id} is already recorded", ("id",entry.id)("scope",scope) );

      const digest_type leaf = entry.leaf_hash();
      ledger_snapshot snapshot;
      snapshot.root       = tree.compute_path( leaf ).back();
      snapshot.vote_count = position + 1;
      snapshot.timestamp  = fc::time_point::now();

      try
      {
         nullifiers.reserve( scope, entry.nullifier, [&]( db::write_batch& batch )
         {
            entry_db.store( entry_key{ scope, position }, entry, batch );
            snapshot_db.store( snapshot_key{ scope, snapshot.vote_count }, snapshot, batch );
            head_db.store( scope, snapshot, batch );
         } );
      }
      catch( const nullifier_already_used& )
      {
         wlog( "rejected vote ${id} in ${scope}: credential already used", ("id",entry.id)("scope",scope) );
         FC_THROW_EXCEPTION( duplicate_nullifier, "credential already used" );
      }

      tree.append( leaf );
      update_index( entry, position );

      append_result result;
      result.position = position;
      result.proof    = tree.proof( position );
      return result;
   }

   void check_position( uint32_t position )const
   {
      if( position >= tree.size() )
         FC_THROW_EXCEPTION( invalid_position, "position ${p} is outside the ledger",
                             ("p",position)("vote_count",tree.size()) );
   }
};
} // namespace detail

vote_ledger::vote_ledger( const string& scope, db::level_database& database,
                          nullifier_registry& nullifiers, uint32_t max_field_size )
{
   FC_ASSERT( !scope.empty() );
   my = std::make_shared<detail::vote_ledger_impl>( scope, database, nullifiers, max_field_size );
}

vote_ledger::~vote_ledger(){}

void vote_ledger::load()
{ try {
   my->load();
} FC_CAPTURE_AND_RETHROW( (my->scope) ) }

const string& vote_ledger::scope()const
{
   return my->scope;
}

append_result vote_ledger::append( const vote_entry& entry )
{
   return my->append( entry );
}

inclusion_proof vote_ledger::get_proof( uint32_t position )const
{
   fc::scoped_lock<fc::mutex> lock( my->state_mutex );
   my->check_position( position );
   return my->tree.proof( position );
}

bool vote_ledger::verify( const inclusion_proof& proof )
{
   return merkle_tree::verify( proof );
}

digest_type vote_ledger::get_root()const
{
   fc::scoped_lock<fc::mutex> lock( my->state_mutex );
   return my->tree.root();
}

uint32_t vote_ledger::get_vote_count()const
{
   fc::scoped_lock<fc::mutex> lock( my->state_mutex );
   return my->tree.size();
}

ledger_snapshot vote_ledger::get_snapshot()const
{
   fc::scoped_lock<fc::mutex> lock( my->state_mutex );
   ledger_snapshot snapshot;
   snapshot.root       = my->tree.root();
   snapshot.vote_count = my->tree.size();
   snapshot.timestamp  = fc::time_point::now();
   return snapshot;
}

ledger_snapshot vote_ledger::get_snapshot_at( uint32_t vote_count )const
{
   fc::scoped_lock<fc::mutex> lock( my->state_mutex );
   if( vote_count == 0 )
   {
      ledger_snapshot empty;
      empty.root = merkle_tree::empty_root();
      return empty;
   }
   if( vote_count > my->tree.size() )
      FC_THROW_EXCEPTION( invalid_position, "ledger never held ${n} votes", ("n",vote_count)("vote_count",my->tree.size()) );
   return my->snapshot_db.fetch( snapshot_key{ my->scope, vote_count } );
}

bool vote_ledger::is_known_root( const digest_type& root )const
{
   fc::scoped_lock<fc::mutex> lock( my->state_mutex );
   return my->root_index.find( root ) != my->root_index.end();
}

vote_entry vote_ledger::get_entry( uint32_t position )const
{
   fc::scoped_lock<fc::mutex> lock( my->state_mutex );
   my->check_position( position );
   return my->entry_db.fetch( entry_key{ my->scope, position } );
}

optional<located_entry> vote_ledger::find_by_nullifier( const nullifier_type& nullifier )const
{
   fc::scoped_lock<fc::mutex> lock( my->state_mutex );
   auto itr = my->nullifier_index.find( nullifier );
   if( itr == my->nullifier_index.end() )
      return optional<located_entry>();

   located_entry located;
   located.entry    = my->entry_db.fetch( entry_key{ my->scope, itr->second } );
   located.position = itr->second;
   return located;
}

vector<public_entry> vote_ledger::export_public_entries()const
{
   fc::scoped_lock<fc::mutex> lock( my->state_mutex );
   vector<public_entry> results;
   results.reserve( my->tree.size() );
   for( uint32_t position = 0; position < my->tree.size(); ++position )
   {
      const vote_entry entry = my->entry_db.fetch( entry_key{ my->scope, position } );
      public_entry item;
      item.position   = position;
      item.commitment = entry.commitment;
      item.nullifier  = entry.nullifier;
      item.timestamp  = entry.timestamp;
      results.push_back( item );
   }
   return results;
}

} } // vil::ledger
