#pragma once

#include <vil/vote/credential_verifier.hpp>
#include <vil/ledger/ledger_database.hpp>

#include <memory>

namespace vil { namespace vote {
namespace detail { class vote_intake_impl; }

/**
 *  @class vote_intake
 *  @brief accepts anonymous votes and records them in the ledger of their scope
 *
 *  A submission is recorded only after its credential signature and its vote
 *  proof verify.  The nullifier reservation and the append are one atomic
 *  step inside the ledger.
 */
class vote_intake
{
   std::shared_ptr<detail::vote_intake_impl> my;

public:
   vote_intake( ledger::ledger_database& ledgers,
                credential_verifier_ptr verifier,
                ledger::nullifier_scope_policy policy = ledger::per_election );
   ~vote_intake();

   /** the authority key credentials of election_id must be signed with */
   void register_election( const string& election_id, const string& authority_public_key );
   bool is_registered( const string& election_id )const;

   /**
    *  @throws unknown_election
    *  @throws invalid_credential
    *  @throws invalid_vote_proof
    *  @throws duplicate_nullifier if the credential already voted in this scope
    */
   vote_receipt submit( const vote_submission& submission );

   /** the public inputs the vote proof of submission is checked against */
   static vector<string> public_inputs( const vote_submission& submission );
};

} } // vil::vote
