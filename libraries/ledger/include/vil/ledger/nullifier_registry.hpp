#pragma once

#include <vil/ledger/types.hpp>
#include <vil/db/level_database.hpp>

#include <functional>
#include <memory>

namespace vil { namespace ledger {
namespace detail { class nullifier_registry_impl; }

/**
 *  @class nullifier_registry
 *  @brief durable set of spent nullifiers, unique per (scope, nullifier)
 *
 *  reserve() is the only way a nullifier becomes used.  It holds the lock of
 *  the scope from the lookup until the record is durably written, so of any
 *  number of concurrent callers with the same (scope, nullifier) exactly one
 *  succeeds.  The registry must be the only writer of its database; leveldb
 *  enforces this across processes with its lock file.
 */
class nullifier_registry
{
   std::shared_ptr<detail::nullifier_registry_impl> my;

public:
   typedef std::function<void( db::write_batch& )> stage_function;

   nullifier_registry();
   ~nullifier_registry();

   void open( db::level_database& database );
   bool is_open()const;
   void close();

   /** @throws nullifier_already_used */
   void reserve( const string& scope, const nullifier_type& nullifier );

   /**
    *  Reserves the nullifier and commits whatever stage() puts into the batch
    *  in the same atomic write.  If stage() throws nothing is written.
    */
   void reserve( const string& scope, const nullifier_type& nullifier, const stage_function& stage );

   /** status only; never use this to decide whether to reserve */
   bool query( const string& scope, const nullifier_type& nullifier )const;

   optional<nullifier_record> get_record( const string& scope, const nullifier_type& nullifier )const;
};

} } // vil::ledger
