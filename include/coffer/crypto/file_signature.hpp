#pragma once

#include "coffer/crypto/crypto_types.hpp"
#include "coffer/crypto/hash.hpp"
#include "coffer/crypto/signature.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace coffer::crypto {

enum class FileSignatureState {
    EMPTY,
    ACCUMULATING,
    FINALIZED
};

// Running digest over chunk_id || plaintext for every chunk of a file, in order.
// The signature covers digest || handle so content cannot be replayed under
// another handle.
class FileSignatureBuilder {
public:
    FileSignatureBuilder();
    
    Result append(std::int32_t chunk_id, std::span<const std::uint8_t> plaintext);
    
    Result finalize(const Ed25519SecretKey& signing_key,
                    const std::string& handle,
                    Ed25519Signature& out_signature);
    
    // False on any mismatch; the error detail is not exposed
    bool verify(const Ed25519PublicKey& public_key,
                const Ed25519Signature& signature,
                const std::string& handle);
    
    FileSignatureState state() const { return state_; }
    std::int32_t next_chunk_id() const { return next_chunk_id_; }

private:
    Result seal();
    
    Blake2bHasher hasher_;
    SignatureEngine signer_;
    FileSignatureState state_;
    std::int32_t next_chunk_id_;
    std::optional<Blake2bHash> digest_;
};

} // namespace coffer::crypto
