#pragma once

#include <vil/ledger/ledger_database.hpp>
#include <vil/ledger/types.hpp>

#include <fc/filesystem.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/reflect/reflect.hpp>

namespace vil { namespace client {

    struct config
    {
        fc::logging_config              logging = fc::logging_config::default_config();

        ledger::nullifier_scope_policy  nullifier_scope_policy = ledger::per_election;
        uint32_t                        default_required_shares = 3;
        uint32_t                        max_field_size = VIL_DEFAULT_MAX_FIELD_SIZE;
        bool                            sync_writes = true;

        ledger::ledger_options get_ledger_options()const;
    };

    fc::logging_config create_default_logging_config( const fc::path& data_dir );

    /**
     *  Reads data_dir/config.json, creating it with defaults when missing, and
     *  writes it back so new fields show up.  Relative log file names are
     *  expanded against data_dir.
     */
    config load_config( const fc::path& data_dir );

} } // vil::client

FC_REFLECT( vil::client::config, (logging)(nullifier_scope_policy)(default_required_shares)(max_field_size)(sync_writes) )
