#define BOOST_TEST_MODULE ClientTests
#include <boost/test/unit_test.hpp>
#include <vil/client/client.hpp>
#include <vil/client/config.hpp>
#include <vil/ledger/exceptions.hpp>
#include <vil/tally/exceptions.hpp>
#include <vil/vote/exceptions.hpp>
#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/file_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>

using namespace vil;

/** signatures are "<key>:<nullifier>" and proofs are "valid" */
class mock_credential_verifier : public vote::credential_verifier
{
   public:
      bool verify_credential_signature( const vote::signed_credential& credential,
                                        const std::string& authority_public_key )const override
      {
         return credential.signature == authority_public_key + ":" + credential.nullifier;
      }

      bool verify_zk_proof( const std::string& proof, const std::vector<std::string>& public_inputs )const override
      {
         return proof == "valid";
      }
};

/** every trustee is known and every partial carries the plaintext */
class mock_threshold_scheme : public tally::threshold_scheme
{
   public:
      fc::optional<tally::trustee_commitment> get_trustee_commitment( const std::string& election_id,
                                                                      const tally::trustee_id_type& trustee_id )const override
      {
         tally::trustee_commitment commitment;
         commitment.trustee_id = trustee_id;
         commitment.commitment = "commit:" + trustee_id;
         return commitment;
      }

      bool verify_partial_proof( const tally::partial_decryption& partial,
                                 const tally::trustee_commitment& commitment )const override
      {
         return partial.correctness_proof == "ok";
      }

      fc::optional<std::string> combine_partials( const std::string& entry_id,
                                                  const std::vector<tally::partial_decryption>& partials )const override
      {
         return partials.front().value;
      }
};

vote::vote_submission make_submission( const std::string& nullifier, const std::string& question )
{
   vote::vote_submission submission;
   submission.election_id            = "election";
   submission.question_id            = question;
   submission.credential.election_id = "election";
   submission.credential.nullifier   = nullifier;
   submission.credential.message     = "credential message";
   submission.credential.signature   = "authority-key:" + nullifier;
   submission.encrypted_vote         = "ciphertext-" + nullifier;
   submission.commitment             = "commitment-" + nullifier;
   submission.zk_proof               = "valid";
   return submission;
}

/** writes a config.json that logs to the console only */
void write_config( const fc::path& data_dir, ledger::nullifier_scope_policy policy, uint32_t required_shares )
{
   client::config cfg = client::load_config( data_dir );
   cfg.logging                 = fc::logging_config::default_config();
   cfg.nullifier_scope_policy  = policy;
   cfg.default_required_shares = required_shares;
   fc::json::save_to_file( cfg, data_dir / "config.json" );
}

BOOST_AUTO_TEST_CASE( config_round_trip )
{
   try {
      fc::temp_directory dir;

      client::config cfg = client::load_config( dir.path() );
      BOOST_CHECK( fc::exists( dir.path() / "config.json" ) );
      BOOST_CHECK( cfg.nullifier_scope_policy == ledger::per_election );
      BOOST_CHECK( cfg.sync_writes );
      BOOST_CHECK_EQUAL( cfg.max_field_size, uint32_t( VIL_DEFAULT_MAX_FIELD_SIZE ) );

      bool found_file_appender = false;
      for( const auto& appender : cfg.logging.appenders )
      {
         if( appender.type != "file" )
            continue;
         found_file_appender = true;
         const auto args = appender.args.as<fc::file_appender::config>();
         BOOST_CHECK( !args.filename.is_relative() );
      }
      BOOST_CHECK( found_file_appender );

      cfg.nullifier_scope_policy  = ledger::per_question;
      cfg.default_required_shares = 5;
      fc::json::save_to_file( cfg, dir.path() / "config.json" );

      const client::config reloaded = client::load_config( dir.path() );
      BOOST_CHECK( reloaded.nullifier_scope_policy == ledger::per_question );
      BOOST_CHECK_EQUAL( reloaded.default_required_shares, 5u );
      BOOST_CHECK_EQUAL( reloaded.get_ledger_options().max_field_size, cfg.max_field_size );

      cfg.default_required_shares = 0;
      fc::json::save_to_file( cfg, dir.path() / "config.json" );
      BOOST_CHECK_THROW( client::load_config( dir.path() ), fc::exception );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( client_applies_the_configured_policy_and_shares )
{
   try {
      fc::temp_directory dir;
      write_config( dir.path(), ledger::per_question, 2 );

      client::client node( std::make_shared<mock_credential_verifier>(), std::make_shared<mock_threshold_scheme>() );
      node.open( dir.path() );
      BOOST_CHECK( node.get_config().nullifier_scope_policy == ledger::per_question );

      node.intake().register_election( "election", "authority-key" );
      BOOST_CHECK_EQUAL( node.intake().submit( make_submission( "n1", "q1" ) ).scope, "election/q1" );
      BOOST_CHECK_EQUAL( node.intake().submit( make_submission( "n1", "q2" ) ).scope, "election/q2" );
      BOOST_CHECK_THROW( node.intake().submit( make_submission( "n1", "q1" ) ), ledger::duplicate_nullifier );

      const tally::decryption_ceremony ceremony = node.start_ceremony( "election/q1" );
      BOOST_CHECK_EQUAL( ceremony.required_shares, 2u );
      BOOST_CHECK( ceremony.status == tally::pending );

      node.ceremonies().abort( "election/q1", "resized trustee set" );
      const tally::decryption_ceremony retry = node.start_ceremony( "election/q1", {}, fc::optional<uint32_t>( 1 ) );
      BOOST_CHECK_EQUAL( retry.required_shares, 1u );
      BOOST_CHECK_EQUAL( retry.attempt, 2u );

      const ledger::vote_entry entry = node.ledgers().find_ledger( "election/q1" )->get_entry( 0 );
      tally::partial_decryption partial;
      partial.trustee_id        = "t1";
      partial.entry_id          = entry.id;
      partial.value             = "alice";
      partial.correctness_proof = "ok";
      const tally::ceremony_progress progress =
         node.ceremonies().submit_partial( "election/q1", "t1", std::vector<tally::partial_decryption>{ partial } );
      BOOST_CHECK( progress.status == tally::completed );

      node.close();

      // the stores are reopened with the same settings
      node.open( dir.path() );
      BOOST_CHECK_EQUAL( node.ledgers().list_scopes().size(), 2u );
      BOOST_CHECK( node.ceremonies().status( "election/q1" ).status == tally::completed );
      // authority keys are registered again by every process that opens the node
      BOOST_CHECK_THROW( node.intake().submit( make_submission( "n2", "q1" ) ), vote::unknown_election );
      node.close();
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}
