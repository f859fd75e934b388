#pragma once

#include "uplink/error/download_error.hpp"
#include "uplink/transport/http_client.hpp"

#include <string>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// RangeProber
// ─────────────────────────────────────────────────────────────────────────────
// Best-effort check whether a server will honor "Range: bytes=N-":
//
//   1. HEAD. If Accept-Ranges is present, trust it ("bytes" => yes, "none" => no).
//   2. Otherwise GET with "Range: bytes=0-0". 206 => yes, anything else => no.
//      The body is never read; the request is dropped as soon as the status
//      line and headers arrive, so a server that ignores the range does not
//      make us pull the whole file.
//
// A transport failure on either request is returned as an error. The engine
// treats that as "unknown" and tries the ranged request anyway.

class RangeProber {
public:
    explicit RangeProber(IHttpClient& client)
        : client_(client)
    {}

    [[nodiscard]] DownloadResult<bool> probe(const std::string& url);

private:
    IHttpClient& client_;
};

}  // namespace uplink
