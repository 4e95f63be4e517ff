#pragma once

#include <vil/vote/types.hpp>

#include <memory>

namespace vil { namespace vote {

/**
 *  @class credential_verifier
 *  @brief blind signature and zero knowledge checks performed for every vote
 *
 *  The cryptography lives behind this interface.  Both checks are mandatory
 *  on the intake path and cannot be switched off.
 */
class credential_verifier
{
   public:
      virtual ~credential_verifier(){}

      virtual bool verify_credential_signature( const signed_credential& credential,
                                                const string& authority_public_key )const = 0;

      virtual bool verify_zk_proof( const string& proof, const vector<string>& public_inputs )const = 0;
};
typedef std::shared_ptr<credential_verifier> credential_verifier_ptr;

} } // vil::vote
