#pragma once

#include <verity/schema/primitives.hpp>
#include <functional>

namespace verity::execution {

/// Checks a transaction signature over its signing message. Returns false on
/// any mismatch. The engine consults it only when strict crypto is on and the
/// signer carries a public key; named signers never reach it.
using signature_verifier_t =
    std::function<bool(const verity::schema::bytes_view_t& signing_message,
                       const verity::schema::signer_id_t& signer,
                       const verity::schema::signature_t& signature)>;

}  // namespace verity::execution
