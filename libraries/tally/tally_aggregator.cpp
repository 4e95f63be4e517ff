#include <vil/tally/tally_aggregator.hpp>
#include <vil/tally/exceptions.hpp>

#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace vil { namespace tally {

   tally_aggregator::tally_aggregator( threshold_scheme_ptr scheme )
   :_scheme( scheme )
   {
      FC_ASSERT( _scheme != nullptr );
   }

   vector<partial_decryption> tally_aggregator::select_quorum( const vector<partial_decryption>& partials,
                                                               uint32_t required_shares )const
   {
      vector<partial_decryption> sorted = partials;
      std::sort( sorted.begin(), sorted.end(),
                 []( const partial_decryption& a, const partial_decryption& b ) { return a.trustee_id < b.trustee_id; } );

      vector<partial_decryption> quorum;
      for( const auto& partial : sorted )
      {
         if( quorum.size() == required_shares )
            break;
         if( !quorum.empty() && quorum.back().trustee_id == partial.trustee_id )
            continue;
         quorum.push_back( partial );
      }
      return quorum;
   }

   tally_result tally_aggregator::combine( const vector<ledger::vote_entry>& entries,
                                           const partials_by_entry_type& partials_by_entry,
                                           uint32_t required_shares,
                                           const vector<candidate_id_type>& candidates )const
   {
      FC_ASSERT( required_shares > 0 );

      std::map<candidate_id_type, uint32_t> counts;
      for( const auto& candidate : candidates )
         counts[candidate] = 0;

      std::set<trustee_id_type> participants;

      // nothing below may leave this function except a generic tally_failure
      for( const auto& entry : entries )
      {
         auto itr = partials_by_entry.find( entry.id );
         if( itr == partials_by_entry.end() )
         {
            elog( "no validated partials for entry ${id}", ("id",entry.id) );
            FC_THROW_EXCEPTION( tally_failure, "tally could not be completed" );
         }

         const vector<partial_decryption> quorum = select_quorum( itr->second, required_shares );
         if( quorum.size() < required_shares )
         {
            elog( "entry ${id} has ${n} of ${k} required partials", ("id",entry.id)("n",quorum.size())("k",required_shares) );
            FC_THROW_EXCEPTION( tally_failure, "tally could not be completed" );
         }

         optional<string> plaintext;
         try
         {
            plaintext = _scheme->combine_partials( entry.id, quorum );
         }
         catch( const fc::exception& e )
         {
            elog( "combining partials of entry ${id} threw: ${e}", ("id",entry.id)("e",e.to_string()) );
         }
         catch( const std::exception& e )
         {
            elog( "combining partials of entry ${id} threw: ${e}", ("id",entry.id)("e",e.what()) );
         }
         catch( ... )
         {
            elog( "combining partials of entry ${id} threw an unrecognized exception", ("id",entry.id) );
         }

         if( !plaintext.valid() )
         {
            elog( "partials of entry ${id} did not combine", ("id",entry.id) );
            FC_THROW_EXCEPTION( tally_failure, "tally could not be completed" );
         }

         if( !candidates.empty() && counts.find( *plaintext ) == counts.end() )
         {
            elog( "entry ${id} decrypted to an unknown candidate", ("id",entry.id) );
            FC_THROW_EXCEPTION( tally_failure, "tally could not be completed" );
         }

         ++counts[*plaintext];
         for( const auto& partial : quorum )
            participants.insert( partial.trustee_id );
      }

      tally_result result;
      if( candidates.empty() )
      {
         for( const auto& item : counts )
         {
            candidate_tally tally;
            tally.candidate_id = item.first;
            tally.votes        = item.second;
            result.candidates.push_back( tally );
         }
      }
      else
      {
         for( const auto& candidate : candidates )
         {
            candidate_tally tally;
            tally.candidate_id = candidate;
            tally.votes        = counts[candidate];
            result.candidates.push_back( tally );
         }
      }
      result.total_votes            = uint32_t( entries.size() );
      result.completed_at           = fc::time_point::now();
      result.participating_trustees = vector<trustee_id_type>( participants.begin(), participants.end() );
      return result;
   }

} } // vil::tally
