#pragma once

#include <vil/ledger/types.hpp>

#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>

#include <string>
#include <vector>

namespace vil { namespace vote {
using fc::optional;
using std::string;
using std::vector;

/**
 *  An anonymous voting credential.  The authority signed message without
 *  seeing it; nullifier is the one-time token that gets spent on voting.
 */
struct signed_credential
{
   string election_id;
   string nullifier;
   string message;
   string signature;
};

struct vote_submission
{
   string            election_id;
   /** only consulted when nullifiers are scoped per question */
   optional<string>  question_id;
   signed_credential credential;
   string            encrypted_vote;
   string            commitment;
   string            zk_proof;
};

/** what the voter keeps to check later that the vote was recorded */
struct vote_receipt
{
   string                  confirmation_code;
   string                  scope;
   uint32_t                position = 0;
   ledger::inclusion_proof proof;
};

} } // vil::vote

FC_REFLECT( vil::vote::signed_credential, (election_id)(nullifier)(message)(signature) )
FC_REFLECT( vil::vote::vote_submission, (election_id)(question_id)(credential)(encrypted_vote)(commitment)(zk_proof) )
FC_REFLECT( vil::vote::vote_receipt, (confirmation_code)(scope)(position)(proof) )
