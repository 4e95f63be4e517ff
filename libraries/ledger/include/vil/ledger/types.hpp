#pragma once

#include <vil/ledger/config.hpp>

#include <fc/crypto/sha256.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/time.hpp>

#include <string>
#include <vector>

namespace vil { namespace ledger {
using fc::optional;
using std::string;
using std::vector;

typedef fc::sha256 digest_type;
typedef string     nullifier_type;

/** tables of the ledger database, each one a key prefix */
enum ledger_table_id
{
   entry_table     = 1,
   snapshot_table  = 2,
   head_table      = 3,
   nullifier_table = 4
};

/**
 *  Decides which votes share a nullifier namespace.  With per_election a
 *  credential may be used once per election; with per_question once per
 *  question of the ballot.
 */
enum nullifier_scope_policy
{
   per_election = 0,
   per_question = 1
};

string make_scope( nullifier_scope_policy policy,
                   const string& election_id,
                   const optional<string>& question_id = optional<string>() );

/**
 *  A single recorded vote.  Entries are immutable once appended; the
 *  zk_proof is stored for auditors but is not part of the leaf hash.
 */
struct vote_entry
{
   string         id;
   string         encrypted_vote;
   string         commitment;
   string         zk_proof;
   nullifier_type nullifier;
   fc::time_point timestamp;

   /** H( id || encrypted_vote || commitment || nullifier ) */
   digest_type leaf_hash()const;

   /** throws validation_error, never hashes or stores anything */
   void validate( uint32_t max_field_size = VIL_DEFAULT_MAX_FIELD_SIZE )const;
};

/** which side of the running hash a proof sibling sits on */
enum sibling_position
{
   left  = 0,
   right = 1
};

/**
 *  Proves that leaf is included under root.  A proof is only meaningful
 *  against the root it names; the ledger retains every root it ever had.
 */
struct inclusion_proof
{
   digest_type               leaf;
   vector<digest_type>       siblings;
   vector<sibling_position>  positions;
   digest_type               root;
};

struct ledger_snapshot
{
   digest_type    root;
   uint32_t       vote_count = 0;
   fc::time_point timestamp;
};

struct nullifier_record
{
   string         scope;
   nullifier_type nullifier;
   fc::time_point reserved_at;
};

struct append_result
{
   uint32_t        position = 0;
   inclusion_proof proof;
};

struct located_entry
{
   vote_entry entry;
   uint32_t   position = 0;
};

/** what an auditor may see of an entry; never the encrypted vote */
struct public_entry
{
   uint32_t       position = 0;
   string         commitment;
   nullifier_type nullifier;
   fc::time_point timestamp;
};

struct entry_key
{
   string   scope;
   uint32_t position;
};

struct snapshot_key
{
   string   scope;
   uint32_t vote_count;
};

struct nullifier_key
{
   string         scope;
   nullifier_type nullifier;
};

} } // vil::ledger

FC_REFLECT_TYPENAME( vil::ledger::nullifier_scope_policy )
FC_REFLECT_ENUM( vil::ledger::nullifier_scope_policy, (per_election)(per_question) )
FC_REFLECT_TYPENAME( vil::ledger::sibling_position )
FC_REFLECT_ENUM( vil::ledger::sibling_position, (left)(right) )
FC_REFLECT( vil::ledger::vote_entry, (id)(encrypted_vote)(commitment)(zk_proof)(nullifier)(timestamp) )
FC_REFLECT( vil::ledger::inclusion_proof, (leaf)(siblings)(positions)(root) )
FC_REFLECT( vil::ledger::ledger_snapshot, (root)(vote_count)(timestamp) )
FC_REFLECT( vil::ledger::nullifier_record, (scope)(nullifier)(reserved_at) )
FC_REFLECT( vil::ledger::append_result, (position)(proof) )
FC_REFLECT( vil::ledger::located_entry, (entry)(position) )
FC_REFLECT( vil::ledger::public_entry, (position)(commitment)(nullifier)(timestamp) )
FC_REFLECT( vil::ledger::entry_key, (scope)(position) )
FC_REFLECT( vil::ledger::snapshot_key, (scope)(vote_count) )
FC_REFLECT( vil::ledger::nullifier_key, (scope)(nullifier) )
