#pragma once

#include <vil/client/config.hpp>
#include <vil/ledger/ledger_database.hpp>
#include <vil/tally/ceremony_coordinator.hpp>
#include <vil/vote/vote_intake.hpp>

#include <fc/filesystem.hpp>
#include <fc/optional.hpp>

#include <memory>
#include <string>
#include <vector>

namespace vil { namespace client {

    namespace detail { class client_impl; }

    /**
     *  @class client
     *  @brief one vote integrity ledger node configured from data_dir/config.json
     *
     *  Owns the ledger store, the intake and the ceremony coordinator.  The
     *  credential verifier and the threshold scheme come from the caller.
     */
    class client
    {
       public:
          client( vote::credential_verifier_ptr verifier, tally::threshold_scheme_ptr scheme );
          ~client();

          /** loads the config, configures logging and opens every store under data_dir */
          void open( const fc::path& data_dir );
          bool is_open()const;
          void close();

          const config&                 get_config()const;
          ledger::ledger_database&      ledgers();
          vote::vote_intake&            intake();
          tally::ceremony_coordinator&  ceremonies();

          /** uses the configured default_required_shares unless required_shares is given */
          tally::decryption_ceremony start_ceremony( const std::string& scope,
                                                     const std::vector<tally::candidate_id_type>& candidates = std::vector<tally::candidate_id_type>(),
                                                     const fc::optional<uint32_t>& required_shares = fc::optional<uint32_t>() );

       private:
          std::shared_ptr<detail::client_impl> my;
    };
    typedef std::shared_ptr<client> client_ptr;

} } // vil::client
