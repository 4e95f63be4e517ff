#pragma once

#include <vil/tally/threshold_scheme.hpp>
#include <vil/ledger/ledger_database.hpp>

#include <fc/filesystem.hpp>

#include <memory>

namespace vil { namespace tally {
namespace detail { class ceremony_coordinator_impl; }

/**
 *  @class ceremony_coordinator
 *  @brief runs the threshold decryption ceremony of each election
 *
 *  A ceremony binds the ledger snapshot current at start and only ever
 *  decrypts the entries under that root.  Trustees submit their partial
 *  decryptions once; when enough distinct trustees have at least one
 *  validated partial the tally is computed on the submitting caller's
 *  thread.
 *
 *  The election id names the ledger scope that is tallied.  Under the
 *  per_question nullifier policy each question scope gets its own ceremony.
 */
class ceremony_coordinator
{
   std::shared_ptr<detail::ceremony_coordinator_impl> my;

public:
   ceremony_coordinator( ledger::ledger_database& ledgers, threshold_scheme_ptr scheme );
   ~ceremony_coordinator();

   /**
    *  Opens data_dir/ceremony_db and reloads every ceremony and its validated
    *  partials.  A tally that was interrupted while combining is finished, or
    *  aborted if it lacks a quorum.  A ceremony whose bound snapshot is no
    *  longer in the ledger is loaded as aborted.
    */
   void open( const fc::path& data_dir, bool sync_writes = true );
   bool is_open()const;
   void close();

   /**
    *  @throws ledger_empty if no vote was recorded for election_id
    *  @throws ceremony_already_started unless the previous attempt was aborted
    */
   decryption_ceremony start( const string& election_id,
                              uint32_t required_shares,
                              const vector<candidate_id_type>& candidates = vector<candidate_id_type>() );

   /**
    *  Invalid partials are dropped one by one; the rest count toward the
    *  quorum.
    *
    *  @throws ceremony_not_found
    *  @throws ceremony_already_completed
    *  @throws duplicate_trustee_submission
    */
   ceremony_progress submit_partial( const string& election_id,
                                     const trustee_id_type& trustee_id,
                                     const vector<partial_decryption>& partials );

   ceremony_progress        status( const string& election_id )const;
   optional<tally_result>   result( const string& election_id )const;
   decryption_ceremony      get_ceremony( const string& election_id )const;

   /** every partial submitted to the current attempt, validated or not */
   vector<partial_record>   get_partials( const string& election_id )const;
   vector<string>           list_ceremonies()const;

   /** @throws ceremony_already_completed if the ceremony already ended */
   void abort( const string& election_id, const string& reason );
};
typedef std::shared_ptr<ceremony_coordinator> ceremony_coordinator_ptr;

} } // vil::tally
