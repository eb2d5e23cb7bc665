#pragma once

/**
 * IntegrityVerifier.hpp
 *
 * Streaming digest accumulator with a final comparison against the
 * expected digest of a task.
 */

#include "DownloadTask.hpp"
#include "../../utils/HashUtils.hpp"

#include <string>
#include <string_view>

namespace qsde::core::transfer {

/**
 * IntegrityVerifier - incremental hash over the bytes of one attempt
 *
 * A verifier built without an expected digest accepts anything and skips
 * hashing entirely. Move-only; owns its OpenSSL context.
 */
class IntegrityVerifier {
public:
    /**
     * Constructor
     * @param algorithm Digest algorithm
     * @param expectedDigest Expected hex digest (empty = verification disabled)
     */
    IntegrityVerifier(DigestAlgorithm algorithm, std::string expectedDigest);

    IntegrityVerifier(IntegrityVerifier&&) noexcept = default;
    IntegrityVerifier& operator=(IntegrityVerifier&&) noexcept = default;

    IntegrityVerifier(const IntegrityVerifier&) = delete;
    IntegrityVerifier& operator=(const IntegrityVerifier&) = delete;

    /**
     * Feed the next bytes of the stream
     * @throws std::logic_error after finalize()
     */
    void update(std::string_view bytes);

    /**
     * Finish the computation
     * @return Lowercase hex digest, empty when verification is disabled
     */
    const std::string& finalize();

    /**
     * Compare the computed digest with the expected one.
     * Finalizes first if needed. Always true when no digest was expected.
     */
    bool verify();

    bool enabled() const { return !m_expected.empty(); }
    DigestAlgorithm algorithm() const { return m_algorithm; }
    const std::string& expected() const { return m_expected; }

    /**
     * OpenSSL message digest for an algorithm
     */
    static const EVP_MD* messageDigest(DigestAlgorithm algorithm);

    /**
     * Length in hex characters of a digest produced by the algorithm
     */
    static size_t hexLength(DigestAlgorithm algorithm);

private:
    DigestAlgorithm m_algorithm;
    std::string m_expected;
    utils::HashUtils::DigestContext m_ctx;
    std::string m_digest;
    bool m_finalized{false};
};

} // namespace qsde::core::transfer
