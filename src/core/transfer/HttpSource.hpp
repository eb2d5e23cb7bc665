#pragma once

/**
 * HttpSource.hpp
 *
 * HTTP(S) transport on top of cpr (libcurl).
 */

#include "NetworkSource.hpp"

namespace qsde::core::transfer {

/**
 * HttpSource - streaming GET with redirects, proxy and stall timeout
 *
 * Bodies of non-2xx responses are never forwarded to the sink.
 */
class HttpSource : public NetworkSource {
public:
    HttpSource() = default;

    FetchResult fetch(const FetchRequest& request,
                      FetchSink& sink,
                      const CancellationToken& token) override;
};

} // namespace qsde::core::transfer
