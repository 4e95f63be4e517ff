#define BOOST_TEST_MODULE LedgerTests
#include <boost/test/unit_test.hpp>
#include <vil/ledger/ledger_database.hpp>
#include <vil/ledger/merkle_tree.hpp>
#include <vil/ledger/exceptions.hpp>
#include <fc/exception/exception.hpp>
#include <fc/filesystem.hpp>
#include <fc/string.hpp>
#include <fc/log/logger.hpp>
#include <fc/io/json.hpp>
#include <fc/reflect/variant.hpp>

using namespace vil::ledger;

vote_entry make_entry( uint32_t i, const std::string& prefix = "vote" )
{
   vote_entry entry;
   entry.id             = prefix + "-" + fc::to_string( uint64_t(i) );
   entry.encrypted_vote = "ciphertext-" + fc::to_string( uint64_t(i) );
   entry.commitment     = "commitment-" + fc::to_string( uint64_t(i) );
   entry.zk_proof       = "proof-" + fc::to_string( uint64_t(i) );
   entry.nullifier      = prefix + "-nullifier-" + fc::to_string( uint64_t(i) );
   entry.timestamp      = fc::time_point::now();
   return entry;
}

struct ledger_fixture
{
   ledger_fixture()
   {
      db.open( dir.path() );
      ledger = db.get_ledger( "election-1" );
   }

   fc::temp_directory dir;
   ledger_database    db;
   vote_ledger_ptr    ledger;
};

BOOST_AUTO_TEST_CASE( empty_ledger )
{
   try {
      ledger_fixture f;
      BOOST_CHECK_EQUAL( f.ledger->get_vote_count(), 0u );
      BOOST_CHECK( f.ledger->get_root() == merkle_tree::empty_root() );
      BOOST_CHECK( f.ledger->get_root() == fc::sha256::hash( std::string( "empty" ) ) );
      BOOST_CHECK_THROW( f.ledger->get_proof( 0 ), invalid_position );
      BOOST_CHECK( !f.db.find_ledger( "election-1" ) );
      BOOST_CHECK( f.db.list_scopes().empty() );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( every_proof_verifies_after_every_append )
{
   try {
      ledger_fixture f;
      for( uint32_t i = 0; i < 17; ++i )
      {
         const append_result result = f.ledger->append( make_entry( i ) );
         BOOST_CHECK_EQUAL( result.position, i );
         BOOST_CHECK( vote_ledger::verify( result.proof ) );
         BOOST_CHECK( result.proof.root == f.ledger->get_root() );
         BOOST_CHECK_EQUAL( f.ledger->get_vote_count(), i + 1 );

         for( uint32_t p = 0; p <= i; ++p )
         {
            const inclusion_proof proof = f.ledger->get_proof( p );
            BOOST_CHECK( vote_ledger::verify( proof ) );
            BOOST_CHECK( proof.root == f.ledger->get_root() );
         }
      }
      BOOST_CHECK_THROW( f.ledger->get_proof( 17 ), invalid_position );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( unpaired_node_is_promoted )
{
   try {
      ledger_fixture f;
      vector<digest_type> leaves;
      for( uint32_t i = 0; i < 3; ++i )
      {
         const vote_entry entry = make_entry( i );
         leaves.push_back( entry.leaf_hash() );
         f.ledger->append( entry );
      }

      const digest_type expected = merkle_tree::hash_pair( merkle_tree::hash_pair( leaves[0], leaves[1] ), leaves[2] );
      BOOST_CHECK( f.ledger->get_root() == expected );

      const inclusion_proof proof = f.ledger->get_proof( 2 );
      BOOST_REQUIRE_EQUAL( proof.siblings.size(), 1u );
      BOOST_CHECK( proof.siblings[0] == merkle_tree::hash_pair( leaves[0], leaves[1] ) );
      BOOST_CHECK( proof.positions[0] == left );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( single_leaf_is_the_root )
{
   try {
      ledger_fixture f;
      const vote_entry entry = make_entry( 0 );
      const append_result result = f.ledger->append( entry );
      BOOST_CHECK( f.ledger->get_root() == entry.leaf_hash() );
      BOOST_CHECK( result.proof.siblings.empty() );
      BOOST_CHECK( vote_ledger::verify( result.proof ) );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( tampered_proofs_are_rejected )
{
   try {
      ledger_fixture f;
      for( uint32_t i = 0; i < 6; ++i )
         f.ledger->append( make_entry( i ) );

      const inclusion_proof proof = f.ledger->get_proof( 3 );
      BOOST_REQUIRE( vote_ledger::verify( proof ) );
      BOOST_REQUIRE( !proof.siblings.empty() );

      inclusion_proof bad_leaf = proof;
      bad_leaf.leaf = make_entry( 99 ).leaf_hash();
      BOOST_CHECK( !vote_ledger::verify( bad_leaf ) );

      inclusion_proof bad_sibling = proof;
      bad_sibling.siblings[0] = fc::sha256::hash( std::string( "forged" ) );
      BOOST_CHECK( !vote_ledger::verify( bad_sibling ) );

      inclusion_proof bad_root = proof;
      bad_root.root = merkle_tree::empty_root();
      BOOST_CHECK( !vote_ledger::verify( bad_root ) );

      inclusion_proof short_positions = proof;
      short_positions.positions.pop_back();
      BOOST_CHECK( !vote_ledger::verify( short_positions ) );

      inclusion_proof extra_sibling = proof;
      extra_sibling.siblings.push_back( proof.leaf );
      BOOST_CHECK( !vote_ledger::verify( extra_sibling ) );

      // a vote whose content was changed after the fact no longer hashes to its leaf
      vote_entry changed = f.ledger->get_entry( 3 );
      BOOST_CHECK( changed.leaf_hash() == proof.leaf );
      changed.encrypted_vote += "x";
      BOOST_CHECK( changed.leaf_hash() != proof.leaf );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( sibling_order_is_significant )
{
   try {
      const digest_type a = make_entry( 1 ).leaf_hash();
      const digest_type b = make_entry( 2 ).leaf_hash();
      BOOST_CHECK( merkle_tree::hash_pair( a, b ) != merkle_tree::hash_pair( b, a ) );

      inclusion_proof proof;
      proof.leaf = a;
      proof.siblings.push_back( b );
      proof.positions.push_back( right );
      proof.root = merkle_tree::hash_pair( a, b );
      BOOST_CHECK( vote_ledger::verify( proof ) );

      proof.positions[0] = left;
      BOOST_CHECK( !vote_ledger::verify( proof ) );

      // a root computed over the swapped pair must not verify either
      proof.root = merkle_tree::hash_pair( b, a );
      proof.positions[0] = right;
      BOOST_CHECK( !vote_ledger::verify( proof ) );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( leaf_hash_covers_recorded_fields_only )
{
   try {
      const vote_entry entry = make_entry( 7 );
      const digest_type leaf = entry.leaf_hash();

      vote_entry other = entry;
      other.zk_proof = "another proof";
      BOOST_CHECK( other.leaf_hash() == leaf );

      other = entry;
      other.id += "x";
      BOOST_CHECK( other.leaf_hash() != leaf );

      other = entry;
      other.commitment += "x";
      BOOST_CHECK( other.leaf_hash() != leaf );

      other = entry;
      other.nullifier += "x";
      BOOST_CHECK( other.leaf_hash() != leaf );

      // moving bytes between fields changes the hash
      vote_entry shifted = entry;
      shifted.id             = "ab";
      shifted.encrypted_vote = "c";
      vote_entry unshifted = entry;
      unshifted.id             = "a";
      unshifted.encrypted_vote = "bc";
      BOOST_CHECK( shifted.leaf_hash() != unshifted.leaf_hash() );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( double_vote_is_rejected )
{
   try {
      ledger_fixture f;
      f.ledger->append( make_entry( 0 ) );
      const digest_type root = f.ledger->get_root();

      vote_entry again = make_entry( 1 );
      again.nullifier = make_entry( 0 ).nullifier;
      BOOST_CHECK_THROW( f.ledger->append( again ), duplicate_nullifier );

      BOOST_CHECK_EQUAL( f.ledger->get_vote_count(), 1u );
      BOOST_CHECK( f.ledger->get_root() == root );

      try
      {
         f.ledger->append( again );
         BOOST_FAIL( "second vote with the same credential was accepted" );
      }
      catch( const duplicate_nullifier& e )
      {
         BOOST_CHECK( e.to_string().find( "credential already used" ) != std::string::npos );
      }

      // the same credential may vote in another election
      vote_ledger_ptr other = f.db.get_ledger( "election-2" );
      other->append( again );
      BOOST_CHECK_EQUAL( other->get_vote_count(), 1u );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( malformed_entries_change_nothing )
{
   try {
      ledger_fixture f;
      f.ledger->append( make_entry( 0 ) );
      const digest_type root = f.ledger->get_root();

      vote_entry no_nullifier = make_entry( 1 );
      no_nullifier.nullifier.clear();
      BOOST_CHECK_THROW( f.ledger->append( no_nullifier ), validation_error );

      vote_entry no_vote = make_entry( 2 );
      no_vote.encrypted_vote.clear();
      BOOST_CHECK_THROW( f.ledger->append( no_vote ), validation_error );

      vote_entry no_commitment = make_entry( 3 );
      no_commitment.commitment.clear();
      BOOST_CHECK_THROW( f.ledger->append( no_commitment ), validation_error );

      vote_entry same_id = make_entry( 4 );
      same_id.id = make_entry( 0 ).id;
      BOOST_CHECK_THROW( f.ledger->append( same_id ), validation_error );

      BOOST_CHECK_EQUAL( f.ledger->get_vote_count(), 1u );
      BOOST_CHECK( f.ledger->get_root() == root );

      // a rejected entry never spends its nullifier
      BOOST_CHECK( !f.db.nullifiers().query( "election-1", no_vote.nullifier ) );
      BOOST_CHECK( !f.db.nullifiers().query( "election-1", same_id.nullifier ) );
      f.ledger->append( make_entry( 2 ) );
      BOOST_CHECK_EQUAL( f.ledger->get_vote_count(), 2u );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( historical_proofs_stay_verifiable )
{
   try {
      ledger_fixture f;
      for( uint32_t i = 0; i < 3; ++i )
         f.ledger->append( make_entry( i ) );

      const inclusion_proof old_proof = f.ledger->get_proof( 1 );
      const digest_type     old_root  = f.ledger->get_root();

      for( uint32_t i = 3; i < 8; ++i )
         f.ledger->append( make_entry( i ) );

      BOOST_CHECK( f.ledger->get_root() != old_root );
      BOOST_CHECK( vote_ledger::verify( old_proof ) );
      BOOST_CHECK( f.ledger->is_known_root( old_root ) );
      BOOST_CHECK( f.ledger->is_known_root( merkle_tree::empty_root() ) );
      BOOST_CHECK( !f.ledger->is_known_root( fc::sha256::hash( std::string( "never" ) ) ) );

      const ledger_snapshot at_three = f.ledger->get_snapshot_at( 3 );
      BOOST_CHECK( at_three.root == old_root );
      BOOST_CHECK_EQUAL( at_three.vote_count, 3u );
      BOOST_CHECK( f.ledger->get_snapshot_at( 0 ).root == merkle_tree::empty_root() );
      BOOST_CHECK( f.ledger->get_snapshot_at( 8 ).root == f.ledger->get_root() );
      BOOST_CHECK_THROW( f.ledger->get_snapshot_at( 9 ), invalid_position );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( lookup_and_audit_export )
{
   try {
      ledger_fixture f;
      for( uint32_t i = 0; i < 4; ++i )
         f.ledger->append( make_entry( i ) );

      auto located = f.ledger->find_by_nullifier( make_entry( 2 ).nullifier );
      BOOST_REQUIRE( located.valid() );
      BOOST_CHECK_EQUAL( located->position, 2u );
      BOOST_CHECK_EQUAL( located->entry.id, make_entry( 2 ).id );
      BOOST_CHECK( !f.ledger->find_by_nullifier( "unknown" ).valid() );

      const vector<public_entry> exported = f.ledger->export_public_entries();
      BOOST_REQUIRE_EQUAL( exported.size(), 4u );
      for( uint32_t i = 0; i < 4; ++i )
      {
         BOOST_CHECK_EQUAL( exported[i].position, i );
         BOOST_CHECK_EQUAL( exported[i].commitment, make_entry( i ).commitment );
      }

      const std::string json = fc::json::to_string( exported );
      BOOST_CHECK( json.find( "ciphertext" ) == std::string::npos );

      const ledger_snapshot snapshot = f.ledger->get_snapshot();
      BOOST_CHECK_EQUAL( snapshot.vote_count, 4u );
      BOOST_CHECK( snapshot.root == f.ledger->get_root() );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( ledger_survives_reopen )
{
   try {
      fc::temp_directory dir;
      digest_type root;
      inclusion_proof proof;
      {
         ledger_database db;
         db.open( dir.path() );
         auto ledger = db.get_ledger( "election-1" );
         for( uint32_t i = 0; i < 5; ++i )
            ledger->append( make_entry( i ) );
         root  = ledger->get_root();
         proof = ledger->get_proof( 4 );
         db.close();
      }

      ledger_database db;
      db.open( dir.path() );
      BOOST_REQUIRE_EQUAL( db.list_scopes().size(), 1u );

      auto ledger = db.find_ledger( "election-1" );
      BOOST_REQUIRE( ledger != nullptr );
      BOOST_CHECK_EQUAL( ledger->get_vote_count(), 5u );
      BOOST_CHECK( ledger->get_root() == root );
      BOOST_CHECK( vote_ledger::verify( proof ) );
      BOOST_CHECK( ledger->is_known_root( proof.root ) );
      BOOST_CHECK( ledger->find_by_nullifier( make_entry( 3 ).nullifier ).valid() );

      // spent nullifiers are still spent
      BOOST_CHECK( db.nullifiers().query( "election-1", make_entry( 0 ).nullifier ) );
      vote_entry again = make_entry( 10 );
      again.nullifier = make_entry( 0 ).nullifier;
      BOOST_CHECK_THROW( ledger->append( again ), duplicate_nullifier );

      ledger->append( make_entry( 5 ) );
      BOOST_CHECK_EQUAL( ledger->get_vote_count(), 6u );
      BOOST_CHECK( vote_ledger::verify( ledger->get_proof( 5 ) ) );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}

BOOST_AUTO_TEST_CASE( scope_policies )
{
   try {
      BOOST_CHECK_EQUAL( make_scope( per_election, "e1" ), "e1" );
      BOOST_CHECK_EQUAL( make_scope( per_election, "e1", std::string( "q1" ) ), "e1" );
      BOOST_CHECK_EQUAL( make_scope( per_question, "e1", std::string( "q1" ) ), "e1/q1" );
      BOOST_CHECK_THROW( make_scope( per_question, "e1" ), validation_error );
      BOOST_CHECK_THROW( make_scope( per_election, "" ), validation_error );

      ledger_fixture f;
      BOOST_CHECK_THROW( f.db.get_ledger( "" ), validation_error );
   }
   catch ( const fc::exception& e )
   {
      elog( "${e}", ("e",e.to_detail_string() ) );
      throw;
   }
}
