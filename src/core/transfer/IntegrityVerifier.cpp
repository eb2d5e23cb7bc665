/**
 * IntegrityVerifier.cpp
 *
 * OpenSSL EVP backed streaming digest.
 */

#include "IntegrityVerifier.hpp"

#include <stdexcept>

namespace qsde::core::transfer {

using utils::HashUtils;

IntegrityVerifier::IntegrityVerifier(DigestAlgorithm algorithm, std::string expectedDigest)
    : m_algorithm(algorithm)
    , m_expected(HashUtils::normalizeHex(expectedDigest))
    , m_ctx(nullptr, &EVP_MD_CTX_free) {

    if (!enabled()) {
        return;
    }

    m_ctx = HashUtils::newContext();
    if (!m_ctx || EVP_DigestInit_ex(m_ctx.get(), messageDigest(algorithm), nullptr) != 1) {
        throw TransferError(ErrorClass::LocalResource, "cannot initialize digest context");
    }
}

void IntegrityVerifier::update(std::string_view bytes) {
    if (m_finalized) {
        throw std::logic_error("IntegrityVerifier::update after finalize");
    }
    if (!enabled() || bytes.empty()) {
        return;
    }
    if (EVP_DigestUpdate(m_ctx.get(), bytes.data(), bytes.size()) != 1) {
        throw TransferError(ErrorClass::LocalResource, "digest update failed");
    }
}

const std::string& IntegrityVerifier::finalize() {
    if (m_finalized) {
        return m_digest;
    }
    m_finalized = true;

    if (!enabled()) {
        return m_digest;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(m_ctx.get(), hash, &hashLen) != 1) {
        throw TransferError(ErrorClass::LocalResource, "digest finalization failed");
    }
    m_digest = HashUtils::toHex(hash, hashLen);
    m_ctx.reset();
    return m_digest;
}

bool IntegrityVerifier::verify() {
    if (!enabled()) {
        return true;
    }
    return HashUtils::constantTimeEquals(finalize(), m_expected);
}

const EVP_MD* IntegrityVerifier::messageDigest(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::MD5:    return EVP_md5();
        case DigestAlgorithm::SHA1:   return EVP_sha1();
        case DigestAlgorithm::SHA256: return EVP_sha256();
        case DigestAlgorithm::SHA512: return EVP_sha512();
    }
    return EVP_sha256();
}

size_t IntegrityVerifier::hexLength(DigestAlgorithm algorithm) {
    return static_cast<size_t>(EVP_MD_size(messageDigest(algorithm))) * 2;
}

} // namespace qsde::core::transfer
