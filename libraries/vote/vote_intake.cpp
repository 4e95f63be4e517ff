#include <vil/vote/vote_intake.hpp>
#include <vil/vote/exceptions.hpp>
#include <vil/ledger/config.hpp>

#include <fc/crypto/hex.hpp>
#include <fc/crypto/rand.hpp>
#include <fc/log/logger.hpp>
#include <fc/thread/mutex.hpp>
#include <fc/thread/scoped_lock.hpp>

#include <boost/algorithm/string/case_conv.hpp>

#include <exception>
#include <map>

namespace vil { namespace vote {

namespace detail {
class vote_intake_impl {
public:
   ledger::ledger_database&          ledgers;
   credential_verifier_ptr           verifier;
   ledger::nullifier_scope_policy    policy;

   mutable fc::mutex                 keys_mutex;
   std::map<string, string>          election_keys;

   vote_intake_impl( ledger::ledger_database& ledgers, credential_verifier_ptr verifier,
                     ledger::nullifier_scope_policy policy )
      : ledgers(ledgers), verifier(verifier), policy(policy) {}

   string random_hex( uint32_t bytes )const
   {
      vector<char> data( bytes );
      fc::rand_bytes( data.data(), int( data.size() ) );
      return fc::to_hex( data.data(), uint32_t( data.size() ) );
   }

   string authority_key( const string& election_id )const
   {
      fc::scoped_lock<fc::mutex> lock( keys_mutex );
      auto itr = election_keys.find( election_id );
      if( itr == election_keys.end() )
         FC_THROW_EXCEPTION( unknown_election, "no authority key registered for election ${e}", ("e",election_id) );
      return itr->second;
   }

   void verify_credential( const vote_submission& submission )const
   {
      const signed_credential& credential = submission.credential;
      if( credential.election_id != submission.election_id )
         FC_THROW_EXCEPTION( invalid_credential, "credential is for a different election" );

      const string key = authority_key( submission.election_id );

      bool verified = false;
      try
      {
         verified = verifier->verify_credential_signature( credential, key );
      }
      catch( const fc::exception& e )
      {
         wlog( "credential verification for election ${e} threw: ${what}", ("e",submission.election_id)("what",e.to_string()) );
      }
      catch( const std::exception& e )
      {
         wlog( "credential verification for election ${e} threw: ${what}", ("e",submission.election_id)("what",e.what()) );
      }
      catch( ... )
      {
         wlog( "credential verification for election ${e} threw an unrecognized exception", ("e",submission.election_id) );
      }
      if( !verified )
         FC_THROW_EXCEPTION( invalid_credential, "invalid credential signature" );
   }

   void verify_proof( const vote_submission& submission )const
   {
      bool verified = false;
      try
      {
         verified = verifier->verify_zk_proof( submission.zk_proof, vote_intake::public_inputs( submission ) );
      }
      catch( const fc::exception& e )
      {
         wlog( "vote proof verification for election ${e} threw: ${what}", ("e",submission.election_id)("what",e.to_string()) );
      }
      catch( const std::exception& e )
      {
         wlog( "vote proof verification for election ${e} threw: ${what}", ("e",submission.election_id)("what",e.what()) );
      }
      catch( ... )
      {
         wlog( "vote proof verification for election ${e} threw an unrecognized exception", ("e",submission.election_id) );
      }
      if( !verified )
         FC_THROW_EXCEPTION( invalid_vote_proof, "vote proof does not verify" );
   }
};
} // namespace detail

vote_intake::vote_intake( ledger::ledger_database& ledgers, credential_verifier_ptr verifier,
                          ledger::nullifier_scope_policy policy )
{
   FC_ASSERT( verifier != nullptr );
   my = std::make_shared<detail::vote_intake_impl>( ledgers, verifier, policy );
}

vote_intake::~vote_intake(){}

void vote_intake::register_election( const string& election_id, const string& authority_public_key )
{
   FC_ASSERT( !election_id.empty() && !authority_public_key.empty() );
   fc::scoped_lock<fc::mutex> lock( my->keys_mutex );
   my->election_keys[election_id] = authority_public_key;
}

bool vote_intake::is_registered( const string& election_id )const
{
   fc::scoped_lock<fc::mutex> lock( my->keys_mutex );
   return my->election_keys.find( election_id ) != my->election_keys.end();
}

vector<string> vote_intake::public_inputs( const vote_submission& submission )
{
   vector<string> inputs;
   inputs.push_back( submission.election_id );
   inputs.push_back( submission.credential.nullifier );
   inputs.push_back( submission.commitment );
   return inputs;
}

vote_receipt vote_intake::submit( const vote_submission& submission )
{ try {
   my->verify_credential( submission );
   my->verify_proof( submission );

   const string scope = ledger::make_scope( my->policy, submission.election_id, submission.question_id );

   ledger::vote_entry entry;
   entry.id             = my->random_hex( 16 );
   entry.encrypted_vote = submission.encrypted_vote;
   entry.commitment     = submission.commitment;
   entry.zk_proof       = submission.zk_proof;
   entry.nullifier      = submission.credential.nullifier;
   entry.timestamp      = fc::time_point::now();

   const ledger::append_result appended = my->ledgers.get_ledger( scope )->append( entry );

   vote_receipt receipt;
   receipt.confirmation_code = boost::algorithm::to_upper_copy( my->random_hex( VIL_CONFIRMATION_CODE_BYTES ) );
   receipt.scope             = scope;
   receipt.position          = appended.position;
   receipt.proof             = appended.proof;

   ilog( "recorded vote ${id} at position ${p} of ${scope}", ("id",entry.id)("p",receipt.position)("scope",scope) );
   return receipt;
} FC_CAPTURE_AND_RETHROW( (submission.election_id) ) }

} } // vil::vote
