#pragma once

#include <vil/ledger/vote_ledger.hpp>
#include <vil/ledger/nullifier_registry.hpp>

#include <fc/filesystem.hpp>

#include <memory>

namespace vil { namespace ledger {
namespace detail { class ledger_database_impl; }

struct ledger_options
{
   uint32_t max_field_size = VIL_DEFAULT_MAX_FIELD_SIZE;
   bool     sync_writes    = true;
};

/**
 *  @class ledger_database
 *  @brief owns the on-disk vote store, the nullifier registry and one ledger per scope
 *
 *  Created and owned by the calling layer and handed to whoever needs a
 *  ledger; there is no process wide registry of ledgers.
 */
class ledger_database
{
   std::shared_ptr<detail::ledger_database_impl> my;

public:
   ledger_database();
   ~ledger_database();

   void open( const fc::path& data_dir, const ledger_options& options = ledger_options() );
   bool is_open()const;
   void close();

   /** the ledger of scope, created empty on first use */
   vote_ledger_ptr get_ledger( const string& scope );

   /** nullptr if no vote was ever recorded for scope */
   vote_ledger_ptr find_ledger( const string& scope )const;

   vector<string>       list_scopes()const;
   nullifier_registry&  nullifiers();
};
typedef std::shared_ptr<ledger_database> ledger_database_ptr;

} } // vil::ledger

FC_REFLECT( vil::ledger::ledger_options, (max_field_size)(sync_writes) )
