#pragma once

#include <vil/ledger/types.hpp>

#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/time.hpp>

#include <string>
#include <vector>

namespace vil { namespace tally {
using fc::optional;
using std::string;
using std::vector;

typedef string trustee_id_type;
typedef string candidate_id_type;

/** tables of the ceremony database */
enum ceremony_table_id
{
   ceremony_table = 1,
   partial_table  = 2
};

/**
 *  pending -> in_progress -> combining -> completed, and aborted from any
 *  state that is not terminal.  Transitions never go backwards.
 */
enum ceremony_status
{
   pending     = 0,
   in_progress = 1,
   combining   = 2,
   completed   = 3,
   aborted     = 4
};

/**
 *  One trustee's share of the decryption of one ledger entry, with a proof
 *  that it was computed correctly from the trustee's key share.
 */
struct partial_decryption
{
   trustee_id_type trustee_id;
   string          entry_id;
   string          value;
   string          correctness_proof;
};

/** public commitment to a trustee's key share, published at key generation */
struct trustee_commitment
{
   trustee_id_type trustee_id;
   string          commitment;
};

struct candidate_tally
{
   candidate_id_type candidate_id;
   uint32_t          votes = 0;
};

struct tally_result
{
   vector<candidate_tally>  candidates;
   uint32_t                 total_votes = 0;
   fc::time_point           completed_at;
   vector<trustee_id_type>  participating_trustees;
};

struct ceremony_progress
{
   uint32_t        received = 0;
   uint32_t        required = 0;
   ceremony_status status = pending;
};

struct decryption_ceremony
{
   string                      election_id;
   uint32_t                    attempt = 0;
   ceremony_status             status = pending;
   uint32_t                    required_shares = 0;
   ledger::ledger_snapshot     bound_snapshot;
   vector<candidate_id_type>   candidates;
   /** every trustee that submitted, in arrival order */
   vector<trustee_id_type>     submitted_trustees;
   /** trustees with at least one validated partial */
   vector<trustee_id_type>     validated_trustees;
   fc::time_point              started_at;
   optional<tally_result>      result;
   optional<string>            abort_reason;

   bool is_terminal()const { return status == completed || status == aborted; }
};

/** audit record of a submitted partial, kept whether or not it validated */
struct partial_record : public partial_decryption
{
   partial_record(){}
   partial_record( const partial_decryption& p )
      : partial_decryption(p){}

   bool           validated = false;
   fc::time_point received_at;
};

struct partial_key
{
   string          election_id;
   uint32_t        attempt;
   trustee_id_type trustee_id;
   string          entry_id;
};

} } // vil::tally

FC_REFLECT_TYPENAME( vil::tally::ceremony_status )
FC_REFLECT_ENUM( vil::tally::ceremony_status, (pending)(in_progress)(combining)(completed)(aborted) )
FC_REFLECT( vil::tally::partial_decryption, (trustee_id)(entry_id)(value)(correctness_proof) )
FC_REFLECT( vil::tally::trustee_commitment, (trustee_id)(commitment) )
FC_REFLECT( vil::tally::candidate_tally, (candidate_id)(votes) )
FC_REFLECT( vil::tally::tally_result, (candidates)(total_votes)(completed_at)(participating_trustees) )
FC_REFLECT( vil::tally::ceremony_progress, (received)(required)(status) )
FC_REFLECT( vil::tally::decryption_ceremony, (election_id)(attempt)(status)(required_shares)(bound_snapshot)
            (candidates)(submitted_trustees)(validated_trustees)(started_at)(result)(abort_reason) )
FC_REFLECT_DERIVED( vil::tally::partial_record, (vil::tally::partial_decryption), (validated)(received_at) )
FC_REFLECT( vil::tally::partial_key, (election_id)(attempt)(trustee_id)(entry_id) )
