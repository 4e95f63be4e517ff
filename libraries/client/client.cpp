#include <vil/client/client.hpp>

#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>

namespace vil { namespace client {

namespace detail {

   class client_impl
   {
      public:
         client_impl( vote::credential_verifier_ptr verifier, tally::threshold_scheme_ptr scheme )
         :_verifier( verifier ),
          _coordinator( _ledgers, scheme )
         {
            FC_ASSERT( _verifier != nullptr );
         }

         config                                _config;
         vote::credential_verifier_ptr         _verifier;
         ledger::ledger_database               _ledgers;
         tally::ceremony_coordinator           _coordinator;
         std::shared_ptr<vote::vote_intake>    _intake;
   };

} // namespace detail

client::client( vote::credential_verifier_ptr verifier, tally::threshold_scheme_ptr scheme )
:my( std::make_shared<detail::client_impl>( verifier, scheme ) )
{
}

client::~client()
{
   if( is_open() )
      close();
}

void client::open( const fc::path& data_dir )
{ try {
   FC_ASSERT( !is_open(), "client is already open" );

   my->_config = load_config( data_dir );
   fc::configure_logging( my->_config.logging );

   my->_ledgers.open( data_dir, my->_config.get_ledger_options() );
   my->_coordinator.open( data_dir, my->_config.sync_writes );
   my->_intake = std::make_shared<vote::vote_intake>( my->_ledgers, my->_verifier, my->_config.nullifier_scope_policy );

   ilog( "opened ${dir} with ${policy} nullifier scopes", ("dir",data_dir)("policy",my->_config.nullifier_scope_policy) );
} FC_CAPTURE_AND_RETHROW( (data_dir) ) }

bool client::is_open()const
{
   return my->_intake != nullptr;
}

void client::close()
{
   FC_ASSERT( is_open(), "client is not open" );
   my->_intake.reset();
   my->_coordinator.close();
   my->_ledgers.close();
}

const config& client::get_config()const
{
   return my->_config;
}

ledger::ledger_database& client::ledgers()
{
   FC_ASSERT( is_open() );
   return my->_ledgers;
}

vote::vote_intake& client::intake()
{
   FC_ASSERT( is_open() );
   return *my->_intake;
}

tally::ceremony_coordinator& client::ceremonies()
{
   FC_ASSERT( is_open() );
   return my->_coordinator;
}

tally::decryption_ceremony client::start_ceremony( const std::string& scope,
                                                   const std::vector<tally::candidate_id_type>& candidates,
                                                   const fc::optional<uint32_t>& required_shares )
{
   FC_ASSERT( is_open() );
   const uint32_t shares = required_shares.valid() ? *required_shares : my->_config.default_required_shares;
   return my->_coordinator.start( scope, shares, candidates );
}

} } // vil::client
