#pragma once

#include <fc/exception/exception.hpp>

namespace vil { namespace vote {

FC_DECLARE_EXCEPTION(         vote_exception,                                      42000, "Vote Exception" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_credential,   vil::vote::vote_exception,     42001, "invalid credential" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_vote_proof,   vil::vote::vote_exception,     42002, "invalid vote proof" );
FC_DECLARE_DERIVED_EXCEPTION( unknown_election,     vil::vote::vote_exception,     42003, "election keys not found" );

} } // vil::vote
