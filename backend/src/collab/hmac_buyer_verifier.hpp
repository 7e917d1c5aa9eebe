#pragma once
#include <string>

#include "collab/verification.hpp"

// Buyer verifier backed by a shared secret: the context data must carry the
// base64 HMAC-SHA256 of the request parameters, issued by whoever holds the secret.
class HmacBuyerVerifier : public IBuyerVerifier {
public:
    // `secret_b64` is the base64-encoded shared key.
    explicit HmacBuyerVerifier(std::string secret_b64);

    bool verify(ListingId listing_id, const Address& identity,
                const TokenReference& asset, std::uint64_t count,
                const Amount& amount, const Currency& currency,
                const std::string& context_data) override;

    // Produces the context data a verified buyer must present.
    std::string sign(ListingId listing_id, const Address& identity,
                     const TokenReference& asset, std::uint64_t count,
                     const Amount& amount, const Currency& currency) const;

private:
    std::string secret_;

    static std::string prehash(ListingId listing_id, const Address& identity,
                               const TokenReference& asset, std::uint64_t count,
                               const Amount& amount, const Currency& currency);
    static std::string base64_encode(const unsigned char* data, size_t len);
    static std::string base64_decode(const std::string& str);
};
