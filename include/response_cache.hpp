#pragma once

#include <string>
#include <optional>
#include <boost/json.hpp>

#include "credential_store.hpp"

namespace credpool {

// Read-through/write-through cache of upstream responses keyed by request fingerprint.
// A thin layer over the store's TTL cache; the gateway client fetches on a miss
// and calls store() with the result.
class ResponseCache {
public:
    explicit ResponseCache(CredentialStore& store);

    /**
     * Builds the cache key for a request: "METHOD endpoint payload", where the
     * payload slot is always present ("null" without one) and spaces in the
     * endpoint are percent-encoded. Object keys are sorted recursively so
     * logically equal payloads share one entry.
     */
    static std::string fingerprint(const std::string& method,
                                   const std::string& endpoint,
                                   const boost::json::value* payload = nullptr);

    // Returns a compact serialization with object keys sorted at every depth.
    static std::string canonicalize(const boost::json::value& payload);

    std::optional<std::string> lookup(const std::string& method,
                                      const std::string& endpoint,
                                      const boost::json::value* payload = nullptr);

    void store(const std::string& method,
               const std::string& endpoint,
               const boost::json::value* payload,
               const std::string& response_body);

private:
    CredentialStore& store_;
};

}
