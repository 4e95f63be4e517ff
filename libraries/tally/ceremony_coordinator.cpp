#include <vil/tally/ceremony_coordinator.hpp>
#include <vil/tally/tally_aggregator.hpp>
#include <vil/tally/exceptions.hpp>
#include <vil/ledger/exceptions.hpp>
#include <vil/db/level_map.hpp>

#include <fc/log/logger.hpp>
#include <fc/thread/mutex.hpp>
#include <fc/thread/scoped_lock.hpp>

#include <algorithm>
#include <exception>
#include <map>
#include <set>
#include <unordered_set>

namespace vil { namespace tally {

namespace detail {

/** the only abort reason a failed tally ever records */
static const char* const tally_failure_reason = "tally could not be completed";

/** in-memory view of one ceremony; every field is guarded by mutex */
struct ceremony_state
{
   fc::mutex                    mutex;
   decryption_ceremony          ceremony;
   vector<ledger::vote_entry>   entries;
   std::unordered_set<string>   entry_ids;
   partials_by_entry_type       validated;
};
typedef std::shared_ptr<ceremony_state> ceremony_state_ptr;

class ceremony_coordinator_impl {
public:
   ledger::ledger_database&                            ledgers;
   threshold_scheme_ptr                                scheme;
   tally_aggregator                                    aggregator;

   db::level_database                                  database;
   db::level_map<string, decryption_ceremony>          ceremony_db;
   db::level_map<partial_key, partial_record>          partial_db;

   mutable fc::mutex                                   ceremonies_mutex;
   std::map<string, ceremony_state_ptr>                ceremonies;

   ceremony_coordinator_impl( ledger::ledger_database& ledgers, threshold_scheme_ptr scheme )
      : ledgers(ledgers), scheme(scheme), aggregator(scheme) {}

   ~ceremony_coordinator_impl()
   {
      if( database.is_open() )
         close();
   }

   void open( const fc::path& data_dir, bool sync_writes )
   {
      FC_ASSERT( !database.is_open(), "Refusing to open already-opened ceremony database." );
      FC_ASSERT( ledgers.is_open(), "ledger database must be opened before the ceremony coordinator" );

      database.open( data_dir / "ceremony_db" );
      database.set_sync_writes( sync_writes );
      ceremony_db.open( database, ceremony_table );
      partial_db.open( database, partial_table );

      fc::scoped_lock<fc::mutex> lock( ceremonies_mutex );
      for( auto itr = ceremony_db.begin(); itr.valid(); ++itr )
      {
         auto state = std::make_shared<ceremony_state>();
         state->ceremony = itr.value();
         try
         {
            bind_entries( *state );
         }
         catch( const fc::exception& e )
         {
            // only this ceremony is unusable, the others still open
            elog( "ceremony ${a} of election ${e} no longer matches its ledger: ${err}",
                  ("a",state->ceremony.attempt)("e",itr.key())("err",e.to_detail_string()) );
            if( !state->ceremony.is_terminal() )
            {
               state->ceremony.status       = aborted;
               state->ceremony.abort_reason = string( "bound ledger snapshot is no longer available" );
            }
         }
         ceremonies[itr.key()] = state;
      }

      for( auto itr = partial_db.begin(); itr.valid(); ++itr )
      {
         const partial_key key = itr.key();
         auto state_itr = ceremonies.find( key.election_id );
         if( state_itr == ceremonies.end() || state_itr->second->ceremony.attempt != key.attempt )
            continue;
         const partial_record record = itr.value();
         if( record.validated )
            state_itr->second->validated[record.entry_id].push_back( record );
      }

      // a tally interrupted between its writes is finished now, no trustee is left to trigger it
      for( const auto& item : ceremonies )
      {
         ceremony_state& state = *item.second;
         fc::scoped_lock<fc::mutex> state_lock( state.mutex );
         if( state.ceremony.status != combining )
            continue;

         wlog( "ceremony ${a} of election ${e} was interrupted while combining",
               ("a",state.ceremony.attempt)("e",item.first) );
         if( state.ceremony.validated_trustees.size() >= state.ceremony.required_shares )
            run_tally( state );
         else
            fail_tally( state );
      }

      ilog( "opened ceremony database ${dir} with ${n} ceremonies", ("dir",data_dir)("n",ceremonies.size()) );
   }

   void close()
   {
      fc::scoped_lock<fc::mutex> lock( ceremonies_mutex );
      ceremonies.clear();
      partial_db.close();
      ceremony_db.close();
      database.close();
   }

   /** loads the entries under the bound root and checks that the ledger still commits to them */
   void bind_entries( ceremony_state& state )
   {
      const decryption_ceremony& ceremony = state.ceremony;
      auto ledger = ledgers.find_ledger( ceremony.election_id );
      if( !ledger )
         FC_THROW_EXCEPTION( ledger::ledger_corrupted, "ceremony ${e} is bound to a ledger that no longer exists",
                             ("e",ceremony.election_id) );

      const ledger::ledger_snapshot recorded = ledger->get_snapshot_at( ceremony.bound_snapshot.vote_count );
      if( recorded.root != ceremony.bound_snapshot.root )
         FC_THROW_EXCEPTION( ledger::ledger_corrupted, "ceremony ${e} is bound to root ${bound} but the ledger recorded ${root}",
                             ("e",ceremony.election_id)("bound",ceremony.bound_snapshot.root)("root",recorded.root) );

      state.entries.clear();
      state.entry_ids.clear();
      state.entries.reserve( ceremony.bound_snapshot.vote_count );
      for( uint32_t position = 0; position < ceremony.bound_snapshot.vote_count; ++position )
      {
         state.entries.push_back( ledger->get_entry( position ) );
         state.entry_ids.insert( state.entries.back().id );
      }
   }

   ceremony_state_ptr find_state( const string& election_id )const
   {
      fc::scoped_lock<fc::mutex> lock( ceremonies_mutex );
      auto itr = ceremonies.find( election_id );
      if( itr == ceremonies.end() )
         FC_THROW_EXCEPTION( ceremony_not_found, "no decryption ceremony for election ${e}", ("e",election_id) );
      return itr->second;
   }

   partial_key key_for( const decryption_ceremony& ceremony, const partial_decryption& partial )const
   {
      partial_key key;
      key.election_id = ceremony.election_id;
      key.attempt     = ceremony.attempt;
      key.trustee_id  = partial.trustee_id;
      key.entry_id    = partial.entry_id;
      return key;
   }

   void check_partial( const ceremony_state& state,
                       const trustee_id_type& trustee_id,
                       const optional<trustee_commitment>& commitment,
                       const partial_decryption& partial )const
   {
      if( partial.trustee_id != trustee_id )
         FC_THROW_EXCEPTION( invalid_partial_proof, "partial names trustee ${p} but was submitted by ${t}",
                             ("p",partial.trustee_id)("t",trustee_id) );
      if( state.entry_ids.find( partial.entry_id ) == state.entry_ids.end() )
         FC_THROW_EXCEPTION( invalid_partial_proof, "entry ${id} is not under the bound root", ("id",partial.entry_id) );
      if( !commitment.valid() )
         FC_THROW_EXCEPTION( invalid_partial_proof, "no key share commitment for trustee ${t}", ("t",trustee_id) );

      bool verified = false;
      try
      {
         verified = scheme->verify_partial_proof( partial, *commitment );
      }
      catch( const fc::exception& e )
      {
         wlog( "verifying partial of ${t} for entry ${id} threw: ${e}",
               ("t",trustee_id)("id",partial.entry_id)("e",e.to_string()) );
      }
      catch( const std::exception& e )
      {
         wlog( "verifying partial of ${t} for entry ${id} threw: ${e}",
               ("t",trustee_id)("id",partial.entry_id)("e",e.what()) );
      }
      catch( ... )
      {
         wlog( "verifying partial of ${t} for entry ${id} threw an unrecognized exception",
               ("t",trustee_id)("id",partial.entry_id) );
      }
      if( !verified )
         FC_THROW_EXCEPTION( invalid_partial_proof, "correctness proof of entry ${id} does not verify", ("id",partial.entry_id) );
   }

   void persist( const decryption_ceremony& ceremony )
   {
      db::write_batch batch;
      ceremony_db.store( ceremony.election_id, ceremony, batch );
      database.write( batch );
   }

   /**
    *  Called with the state locked once the quorum is reached.  Leaves the
    *  ceremony completed or aborted; what went wrong is only logged.
    */
   void run_tally( ceremony_state& state )
   {
      decryption_ceremony updated = state.ceremony;
      try
      {
         updated.status = combining;
         persist( updated );
         state.ceremony = updated;

         ilog( "election ${e} reached ${n} of ${k} trustees, combining",
               ("e",updated.election_id)("n",updated.validated_trustees.size())("k",updated.required_shares) );

         updated.result = aggregator.combine( state.entries, state.validated, updated.required_shares, updated.candidates );
         updated.status = completed;
         persist( updated );
         state.ceremony = updated;

         ilog( "tally of election ${e} completed over ${n} votes", ("e",updated.election_id)("n",updated.result->total_votes) );
         return;
      }
      catch( const fc::exception& e )
      {
         elog( "tally of election ${e} failed: ${err}", ("e",updated.election_id)("err",e.to_string()) );
      }
      catch( const std::exception& e )
      {
         elog( "tally of election ${e} failed: ${err}", ("e",updated.election_id)("err",e.what()) );
      }
      catch( ... )
      {
         elog( "tally of election ${e} failed with an unrecognized exception", ("e",updated.election_id) );
      }
      fail_tally( state );
   }

   void fail_tally( ceremony_state& state )
   {
      decryption_ceremony failed = state.ceremony;
      failed.status       = aborted;
      failed.result       = optional<tally_result>();
      failed.abort_reason = string( tally_failure_reason );
      state.ceremony = failed;
      persist( failed );

      elog( "ceremony ${a} of election ${e} aborted", ("a",failed.attempt)("e",failed.election_id) );
   }

   ceremony_progress progress_of( const decryption_ceremony& ceremony )const
   {
      ceremony_progress progress;
      progress.received = uint32_t( ceremony.validated_trustees.size() );
      progress.required = ceremony.required_shares;
      progress.status   = ceremony.status;
      return progress;
   }
};
} // namespace detail

ceremony_coordinator::ceremony_coordinator( ledger::ledger_database& ledgers, threshold_scheme_ptr scheme )
{
   my = std::make_shared<detail::ceremony_coordinator_impl>( ledgers, scheme );
}

ceremony_coordinator::~ceremony_coordinator(){}

void ceremony_coordinator::open( const fc::path& data_dir, bool sync_writes )
{ try {
   my->open( data_dir, sync_writes );
} FC_CAPTURE_AND_RETHROW( (data_dir) ) }

bool ceremony_coordinator::is_open()const
{
   return my->database.is_open();
}

void ceremony_coordinator::close()
{
   FC_ASSERT( is_open(), "Cannot close unopened ceremony database." );
   my->close();
}

decryption_ceremony ceremony_coordinator::start( const string& election_id,
                                                 uint32_t required_shares,
                                                 const vector<candidate_id_type>& candidates )
{ try {
   FC_ASSERT( is_open() );
   if( election_id.empty() )
      FC_THROW_EXCEPTION( ledger::validation_error, "election id must not be empty" );
   if( required_shares == 0 )
      FC_THROW_EXCEPTION( ledger::validation_error, "a ceremony needs at least one share" );
   if( std::set<candidate_id_type>( candidates.begin(), candidates.end() ).size() != candidates.size() )
      FC_THROW_EXCEPTION( ledger::validation_error, "candidate list contains duplicates" );

   fc::scoped_lock<fc::mutex> lock( my->ceremonies_mutex );

   uint32_t attempt = 1;
   auto itr = my->ceremonies.find( election_id );
   if( itr != my->ceremonies.end() )
   {
      fc::scoped_lock<fc::mutex> state_lock( itr->second->mutex );
      const decryption_ceremony& previous = itr->second->ceremony;
      if( previous.status != aborted )
         FC_THROW_EXCEPTION( ceremony_already_started, "election ${e} already has a ${s} ceremony",
                             ("e",election_id)("s",previous.status) );
      attempt = previous.attempt + 1;
   }

   auto ledger = my->ledgers.find_ledger( election_id );
   if( !ledger )
      FC_THROW_EXCEPTION( ledger::ledger_empty, "no votes were recorded for election ${e}", ("e",election_id) );

   auto state = std::make_shared<detail::ceremony_state>();
   decryption_ceremony& ceremony = state->ceremony;
   ceremony.election_id     = election_id;
   ceremony.attempt         = attempt;
   ceremony.status          = pending;
   ceremony.required_shares = required_shares;
   ceremony.bound_snapshot  = ledger->get_snapshot();
   ceremony.candidates      = candidates;
   ceremony.started_at      = fc::time_point::now();
   my->bind_entries( *state );

   my->persist( ceremony );
   my->ceremonies[election_id] = state;

   ilog( "started ceremony ${a} of election ${e}: ${k} shares over ${n} votes, root ${root}",
         ("a",attempt)("e",election_id)("k",required_shares)
         ("n",ceremony.bound_snapshot.vote_count)("root",ceremony.bound_snapshot.root) );
   return ceremony;
} FC_CAPTURE_AND_RETHROW( (election_id)(required_shares)(candidates) ) }

ceremony_progress ceremony_coordinator::submit_partial( const string& election_id,
                                                        const trustee_id_type& trustee_id,
                                                        const vector<partial_decryption>& partials )
{ try {
   FC_ASSERT( is_open() );
   auto state = my->find_state( election_id );
   fc::scoped_lock<fc::mutex> lock( state->mutex );

   const decryption_ceremony& current = state->ceremony;
   if( current.is_terminal() )
      FC_THROW_EXCEPTION( ceremony_already_completed, "ceremony of election ${e} is ${s}",
                          ("e",election_id)("s",current.status) );
   if( std::find( current.submitted_trustees.begin(), current.submitted_trustees.end(), trustee_id )
       != current.submitted_trustees.end() )
      FC_THROW_EXCEPTION( duplicate_trustee_submission, "trustee ${t} already submitted", ("t",trustee_id)("e",election_id) );

   const optional<trustee_commitment> commitment = my->scheme->get_trustee_commitment( election_id, trustee_id );

   const fc::time_point now = fc::time_point::now();
   db::write_batch batch;
   vector<partial_decryption> accepted;
   std::set<string> seen_entries;

   for( const auto& partial : partials )
   {
      if( !seen_entries.insert( partial.entry_id ).second )
      {
         wlog( "dropped repeated partial of ${t} for entry ${id}", ("t",trustee_id)("id",partial.entry_id) );
         continue;
      }

      partial_record record( partial );
      record.received_at = now;
      try
      {
         my->check_partial( *state, trustee_id, commitment, partial );
         record.validated = true;
         accepted.push_back( partial );
      }
      catch( const invalid_partial_proof& e )
      {
         wlog( "dropped partial of ${t} for entry ${id}: ${reason}",
               ("t",trustee_id)("id",partial.entry_id)("reason",e.to_string()) );
      }

      // a partial naming another trustee is logged but never stored under that trustee's key
      if( partial.trustee_id == trustee_id )
         my->partial_db.store( my->key_for( current, partial ), record, batch );
   }

   decryption_ceremony updated = current;
   updated.submitted_trustees.push_back( trustee_id );
   if( !accepted.empty() )
      updated.validated_trustees.push_back( trustee_id );
   if( updated.status == pending )
      updated.status = in_progress;

   my->ceremony_db.store( election_id, updated, batch );
   my->database.write( batch );

   state->ceremony = updated;
   for( const auto& partial : accepted )
      state->validated[partial.entry_id].push_back( partial );

   ilog( "trustee ${t} submitted ${n} partials to election ${e}, ${v} valid",
         ("t",trustee_id)("n",partials.size())("e",election_id)("v",accepted.size()) );

   if( state->ceremony.validated_trustees.size() >= state->ceremony.required_shares )
      my->run_tally( *state );

   return my->progress_of( state->ceremony );
} FC_CAPTURE_AND_RETHROW( (election_id)(trustee_id) ) }

ceremony_progress ceremony_coordinator::status( const string& election_id )const
{
   auto state = my->find_state( election_id );
   fc::scoped_lock<fc::mutex> lock( state->mutex );
   return my->progress_of( state->ceremony );
}

optional<tally_result> ceremony_coordinator::result( const string& election_id )const
{
   auto state = my->find_state( election_id );
   fc::scoped_lock<fc::mutex> lock( state->mutex );
   if( state->ceremony.status != completed )
      return optional<tally_result>();
   return state->ceremony.result;
}

decryption_ceremony ceremony_coordinator::get_ceremony( const string& election_id )const
{
   auto state = my->find_state( election_id );
   fc::scoped_lock<fc::mutex> lock( state->mutex );
   return state->ceremony;
}

vector<partial_record> ceremony_coordinator::get_partials( const string& election_id )const
{
   auto state = my->find_state( election_id );
   fc::scoped_lock<fc::mutex> lock( state->mutex );

   vector<partial_record> results;
   for( auto itr = my->partial_db.begin(); itr.valid(); ++itr )
   {
      const partial_key key = itr.key();
      if( key.election_id == election_id && key.attempt == state->ceremony.attempt )
         results.push_back( itr.value() );
   }
   return results;
}

vector<string> ceremony_coordinator::list_ceremonies()const
{
   fc::scoped_lock<fc::mutex> lock( my->ceremonies_mutex );
   vector<string> results;
   for( const auto& item : my->ceremonies )
      results.push_back( item.first );
   return results;
}

void ceremony_coordinator::abort( const string& election_id, const string& reason )
{ try {
   FC_ASSERT( is_open() );
   auto state = my->find_state( election_id );
   fc::scoped_lock<fc::mutex> lock( state->mutex );

   if( state->ceremony.is_terminal() )
      FC_THROW_EXCEPTION( ceremony_already_completed, "ceremony of election ${e} is ${s}",
                          ("e",election_id)("s",state->ceremony.status) );

   decryption_ceremony updated = state->ceremony;
   updated.status       = aborted;
   updated.abort_reason = reason;
   my->persist( updated );
   state->ceremony = updated;

   wlog( "aborted ceremony ${a} of election ${e}: ${reason}", ("a",updated.attempt)("e",election_id)("reason",reason) );
} FC_CAPTURE_AND_RETHROW( (election_id)(reason) ) }

} } // vil::tally
