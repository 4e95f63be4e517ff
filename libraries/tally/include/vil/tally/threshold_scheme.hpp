#pragma once

#include <vil/tally/types.hpp>

#include <memory>

namespace vil { namespace tally {

/**
 *  @class threshold_scheme
 *  @brief the threshold key subsystem as seen by the tally
 *
 *  Implementations own the number theory (share verification and Lagrange
 *  combination).  All calls are synchronous; any timeout or retry policy
 *  belongs to the implementation or its caller.
 */
class threshold_scheme
{
   public:
      virtual ~threshold_scheme(){}

      /** the commitment published for trustee at key generation, if the trustee is known */
      virtual optional<trustee_commitment> get_trustee_commitment( const string& election_id,
                                                                   const trustee_id_type& trustee_id )const = 0;

      virtual bool verify_partial_proof( const partial_decryption& partial,
                                         const trustee_commitment& commitment )const = 0;

      /**
       *  Recovers the plaintext choice of one entry from a quorum of partials.
       *  @return an empty optional if the partials do not combine
       */
      virtual optional<string> combine_partials( const string& entry_id,
                                                 const vector<partial_decryption>& partials )const = 0;
};
typedef std::shared_ptr<threshold_scheme> threshold_scheme_ptr;

} } // vil::tally
