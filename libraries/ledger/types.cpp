#include <vil/ledger/types.hpp>
#include <vil/ledger/exceptions.hpp>

#include <fc/io/raw.hpp>
#include <fc/reflect/variant.hpp>

namespace vil { namespace ledger {

   string make_scope( nullifier_scope_policy policy, const string& election_id, const optional<string>& question_id )
   {
      if( election_id.empty() )
         FC_THROW_EXCEPTION( validation_error, "election id must not be empty" );
      if( policy == per_election )
         return election_id;

      if( !question_id.valid() || question_id->empty() )
         FC_THROW_EXCEPTION( validation_error, "per-question nullifier scope requires a question id",
                             ("election_id",election_id) );
      return election_id + VIL_SCOPE_SEPARATOR + *question_id;
   }

   digest_type vote_entry::leaf_hash()const
   {
      fc::sha256::encoder enc;
      fc::raw::pack( enc, VIL_LEAF_HASH_PREFIX );
      fc::raw::pack( enc, id );
      fc::raw::pack( enc, encrypted_vote );
      fc::raw::pack( enc, commitment );
      fc::raw::pack( enc, nullifier );
      return enc.result();
   }

   void vote_entry::validate( uint32_t max_field_size )const
   {
      if( id.empty() || id.size() > VIL_MAX_ENTRY_ID_SIZE )
         FC_THROW_EXCEPTION( validation_error, "entry id must be between 1 and ${max} bytes",
                             ("max",VIL_MAX_ENTRY_ID_SIZE)("size",id.size()) );
      if( nullifier.empty() || nullifier.size() > VIL_MAX_NULLIFIER_SIZE )
         FC_THROW_EXCEPTION( validation_error, "nullifier must be between 1 and ${max} bytes",
                             ("max",VIL_MAX_NULLIFIER_SIZE)("id",id) );
      if( encrypted_vote.empty() || encrypted_vote.size() > max_field_size )
         FC_THROW_EXCEPTION( validation_error, "encrypted vote must be between 1 and ${max} bytes",
                             ("max",max_field_size)("id",id) );
      if( commitment.empty() || commitment.size() > max_field_size )
         FC_THROW_EXCEPTION( validation_error, "commitment must be between 1 and ${max} bytes",
                             ("max",max_field_size)("id",id) );
      if( zk_proof.empty() || zk_proof.size() > max_field_size )
         FC_THROW_EXCEPTION( validation_error, "zk proof must be between 1 and ${max} bytes",
                             ("max",max_field_size)("id",id) );
      if( timestamp == fc::time_point() )
         FC_THROW_EXCEPTION( validation_error, "entry ${id} has no timestamp", ("id",id) );
   }

} } // vil::ledger
