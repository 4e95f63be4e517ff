#pragma once

#include <fc/exception/exception.hpp>

namespace vil { namespace tally {

FC_DECLARE_EXCEPTION(         tally_exception,                                                   41000, "Tally Exception" );
FC_DECLARE_DERIVED_EXCEPTION( ceremony_not_found,           vil::tally::tally_exception,         41001, "decryption ceremony not found" );
FC_DECLARE_DERIVED_EXCEPTION( ceremony_already_completed,   vil::tally::tally_exception,         41002, "decryption ceremony already completed" );
FC_DECLARE_DERIVED_EXCEPTION( duplicate_trustee_submission, vil::tally::tally_exception,         41003, "trustee already submitted partial decryptions" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_partial_proof,        vil::tally::tally_exception,         41004, "invalid partial decryption proof" );
FC_DECLARE_DERIVED_EXCEPTION( tally_failure,                vil::tally::tally_exception,         41005, "tally could not be completed" );
FC_DECLARE_DERIVED_EXCEPTION( ceremony_already_started,     vil::tally::tally_exception,         41006, "decryption ceremony already started" );

} } // vil::tally
