/**
 * HttpSource.cpp
 *
 * Streaming download through cpr. The write callback forwards body bytes
 * of the final 2xx response to the sink; the progress callback lets curl
 * notice cancellation even while no bytes arrive.
 */

#include "HttpSource.hpp"
#include "../Logger.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace qsde::core::transfer {

namespace {

struct ResponseHead {
    int statusCode{0};
    uint64_t contentLength{0};
    bool started{false};
};

bool startsWithNoCase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

// Status lines restart the head: every redirect hop sends a new one
void parseHeaderLine(std::string_view line, ResponseHead& head) {
    if (startsWithNoCase(line, "HTTP/")) {
        auto space = line.find(' ');
        head.statusCode = space == std::string_view::npos
            ? 0 : std::atoi(std::string(line.substr(space + 1, 3)).c_str());
        head.contentLength = 0;
        return;
    }
    constexpr std::string_view kLength = "content-length:";
    if (startsWithNoCase(line, kLength)) {
        std::string value(line.substr(kLength.size()));
        head.contentLength = std::strtoull(value.c_str(), nullptr, 10);
    }
}

} // namespace

FetchResult HttpSource::fetch(const FetchRequest& request,
                              FetchSink& sink,
                              const CancellationToken& token) {
    ResponseHead head;
    bool sinkRefused = false;

    cpr::Session session;
    session.SetUrl(cpr::Url{request.url});
    session.SetUserAgent(cpr::UserAgent{request.network.userAgent});
    session.SetConnectTimeout(cpr::ConnectTimeout{request.network.connectTimeout});
    // Abort when fewer than 1 byte/s arrive for `timeout` seconds
    session.SetLowSpeed(cpr::LowSpeed{1, static_cast<std::int32_t>(request.network.timeout.count())});
    session.SetVerifySsl(cpr::VerifySsl{request.network.verifySsl});
    if (!request.network.proxy.empty()) {
        session.SetProxies(cpr::Proxies{{"http", request.network.proxy},
                                        {"https", request.network.proxy}});
    }

    session.SetHeaderCallback(cpr::HeaderCallback{
        [&head](std::string_view line, intptr_t /*userdata*/) -> bool {
            parseHeaderLine(line, head);
            return true;
        }});

    session.SetProgressCallback(cpr::ProgressCallback{
        [&token](cpr::cpr_off_t /*downloadTotal*/, cpr::cpr_off_t /*downloadNow*/,
                 cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                 intptr_t /*userdata*/) -> bool {
            return !token.isCancelled();
        }});

    cpr::Response response = session.Download(cpr::WriteCallback{
        [&](std::string_view data, intptr_t /*userdata*/) -> bool {
            if (token.isCancelled()) {
                return false;
            }
            if (!isSuccessStatus(head.statusCode)) {
                return true; // error page, drained and discarded
            }
            if (!head.started) {
                head.started = true;
                if (sink.onStart) sink.onStart(head.contentLength);
            }
            if (!sink.onData(data)) {
                sinkRefused = true;
                return false;
            }
            return true;
        }});

    if (token.isCancelled() || sinkRefused) {
        return FetchResult::aborted();
    }

    if (response.error) {
        Logger::instance().debug("Transport error for {}: {}", request.url, response.error.message);
        return FetchResult::failed(ErrorClass::Transient, 0, response.error.message);
    }

    const int status = static_cast<int>(response.status_code);
    if (!isSuccessStatus(status)) {
        return FetchResult::failed(classifyHttpStatus(status), status,
                                   "HTTP " + std::to_string(status));
    }

    if (!head.started && sink.onStart) {
        sink.onStart(head.contentLength);
    }
    return FetchResult::completed(status);
}

} // namespace qsde::core::transfer
