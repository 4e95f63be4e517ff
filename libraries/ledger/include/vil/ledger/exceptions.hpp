#pragma once

#include <fc/exception/exception.hpp>

namespace vil { namespace ledger {

FC_DECLARE_EXCEPTION(         ledger_exception,                                          40000, "Ledger Exception" );
FC_DECLARE_DERIVED_EXCEPTION( validation_error,       vil::ledger::ledger_exception,     40001, "invalid vote entry" );
FC_DECLARE_DERIVED_EXCEPTION( duplicate_nullifier,    vil::ledger::ledger_exception,     40002, "credential already used" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_position,       vil::ledger::ledger_exception,     40003, "invalid ledger position" );
FC_DECLARE_DERIVED_EXCEPTION( ledger_empty,           vil::ledger::ledger_exception,     40004, "ledger is empty" );
FC_DECLARE_DERIVED_EXCEPTION( nullifier_already_used, vil::ledger::ledger_exception,     40005, "nullifier already used" );
FC_DECLARE_DERIVED_EXCEPTION( ledger_corrupted,       vil::ledger::ledger_exception,     40006, "stored ledger does not match its recorded root" );

} } // vil::ledger
