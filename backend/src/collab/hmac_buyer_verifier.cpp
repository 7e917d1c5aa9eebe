#include "hmac_buyer_verifier.hpp"
#include <openssl/hmac.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <stdexcept>
#include <sstream>
#include <vector>

HmacBuyerVerifier::HmacBuyerVerifier(std::string secret_b64)
    : secret_(base64_decode(secret_b64))
{
    if (secret_.empty()) {
        throw std::runtime_error("HmacBuyerVerifier: empty or malformed secret");
    }
}

std::string HmacBuyerVerifier::prehash(ListingId listing_id, const Address& identity,
    const TokenReference& asset, std::uint64_t count,
    const Amount& amount, const Currency& currency) {
    // Field order is part of the signature format.
    std::ostringstream os;
    os << listing_id << '|' << identity << '|' << asset.contract << '|' << asset.token_id
       << '|' << count << '|' << amount.str() << '|' << currency;
    return os.str();
}

std::string HmacBuyerVerifier::sign(ListingId listing_id, const Address& identity,
    const TokenReference& asset, std::uint64_t count,
    const Amount& amount, const Currency& currency) const {
    const std::string message = prehash(listing_id, identity, asset, count, amount, currency);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (!HMAC(EVP_sha256(),
        secret_.data(),
        static_cast<int>(secret_.length()),
        reinterpret_cast<const unsigned char*>(message.data()),
        message.length(),
        digest,
        &digest_len)) {
        throw std::runtime_error("HmacBuyerVerifier: HMAC computation failed");
    }

    return base64_encode(digest, digest_len);
}

bool HmacBuyerVerifier::verify(ListingId listing_id, const Address& identity,
    const TokenReference& asset, std::uint64_t count,
    const Amount& amount, const Currency& currency,
    const std::string& context_data) {
    if (context_data.empty()) return false;

    const std::string expected = sign(listing_id, identity, asset, count, amount, currency);
    if (expected.size() != context_data.size()) return false;
    return CRYPTO_memcmp(expected.data(), context_data.data(), expected.size()) == 0;
}

std::string HmacBuyerVerifier::base64_encode(const unsigned char* data, size_t len) {
    BIO* bio, * b64;
    BUF_MEM* bufferPtr;

    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);
    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

    BIO_write(bio, data, static_cast<int>(len));
    BIO_flush(bio);
    BIO_get_mem_ptr(bio, &bufferPtr);
    BIO_set_close(bio, BIO_NOCLOSE);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);
    BUF_MEM_free(bufferPtr);

    return result;
}

std::string HmacBuyerVerifier::base64_decode(const std::string& str) {
    BIO* bio, * b64;
    int decode_len = static_cast<int>(str.length());
    std::vector<unsigned char> buffer(decode_len + 1);

    bio = BIO_new_mem_buf(str.data(), decode_len);
    b64 = BIO_new(BIO_f_base64());
    bio = BIO_push(b64, bio);
    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

    int length = BIO_read(bio, buffer.data(), decode_len);
    BIO_free_all(bio);
    if (length <= 0) return {};

    return std::string(reinterpret_cast<char*>(buffer.data()), length);
}
