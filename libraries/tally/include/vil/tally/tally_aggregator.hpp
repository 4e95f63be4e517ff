#pragma once

#include <vil/tally/threshold_scheme.hpp>

#include <map>

namespace vil { namespace tally {

typedef std::map< string, vector<partial_decryption> > partials_by_entry_type;

/**
 *  @class tally_aggregator
 *  @brief turns validated partial decryptions into per-candidate counts
 *
 *  Either every entry decrypts and a full result is returned, or
 *  tally_failure is thrown and nothing about the counts is revealed.
 */
class tally_aggregator
{
   public:
      explicit tally_aggregator( threshold_scheme_ptr scheme );

      /**
       *  @param partials_by_entry validated partials keyed by entry id
       *  @param candidates when not empty, the only acceptable plaintexts; each
       *         is reported even with zero votes
       *  @throws tally_failure
       */
      tally_result combine( const vector<ledger::vote_entry>& entries,
                            const partials_by_entry_type& partials_by_entry,
                            uint32_t required_shares,
                            const vector<candidate_id_type>& candidates = vector<candidate_id_type>() )const;

   private:
      vector<partial_decryption> select_quorum( const vector<partial_decryption>& partials,
                                                uint32_t required_shares )const;

      threshold_scheme_ptr _scheme;
};

} } // vil::tally
