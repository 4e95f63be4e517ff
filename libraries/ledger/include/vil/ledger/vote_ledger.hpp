#pragma once

#include <vil/ledger/types.hpp>
#include <vil/ledger/nullifier_registry.hpp>
#include <vil/db/level_database.hpp>

#include <memory>

namespace vil { namespace ledger {
namespace detail { class vote_ledger_impl; }

/**
 *  @class vote_ledger
 *  @brief append-only Merkle ledger of the votes of one scope
 *
 *  Appending reserves the entry's nullifier and persists the entry and the
 *  new root in one atomic write.  Readers always observe the state before or
 *  after an append, never a partially updated tree.
 */
class vote_ledger
{
   std::shared_ptr<detail::vote_ledger_impl> my;

public:
   vote_ledger( const string& scope,
                db::level_database& database,
                nullifier_registry& nullifiers,
                uint32_t max_field_size = VIL_DEFAULT_MAX_FIELD_SIZE );
   ~vote_ledger();

   /** rebuilds the tree from stored entries and checks it against the stored root */
   void load();

   const string& scope()const;

   /**
    *  @throws validation_error if the entry is malformed
    *  @throws duplicate_nullifier if the entry's nullifier was already used in this scope
    */
   append_result append( const vote_entry& entry );

   /** @throws invalid_position outside [0, vote_count) */
   inclusion_proof get_proof( uint32_t position )const;

   static bool verify( const inclusion_proof& proof );

   digest_type     get_root()const;
   uint32_t        get_vote_count()const;
   ledger_snapshot get_snapshot()const;

   /** the retained snapshot taken when the ledger held vote_count entries */
   ledger_snapshot get_snapshot_at( uint32_t vote_count )const;
   bool            is_known_root( const digest_type& root )const;

   vote_entry              get_entry( uint32_t position )const;
   optional<located_entry> find_by_nullifier( const nullifier_type& nullifier )const;
   vector<public_entry>    export_public_entries()const;
};
typedef std::shared_ptr<vote_ledger> vote_ledger_ptr;

} } // vil::ledger
