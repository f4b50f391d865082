#include "response_cache.hpp"
#include "metrics.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace json = boost::json;

namespace credpool {

namespace {

json::value sorted_copy(const json::value& v) {
    if (v.is_object()) {
        const auto& obj = v.as_object();
        std::vector<std::string> keys;
        keys.reserve(obj.size());
        for (const auto& kv : obj) {
            keys.emplace_back(kv.key().data(), kv.key().size());
        }
        std::sort(keys.begin(), keys.end());

        json::object out;
        for (const auto& k : keys) {
            out[k] = sorted_copy(obj.at(k));
        }
        return out;
    }
    if (v.is_array()) {
        json::array out;
        for (const auto& item : v.as_array()) {
            out.push_back(sorted_copy(item));
        }
        return out;
    }
    return v;
}

}

ResponseCache::ResponseCache(CredentialStore& store) : store_(store) {
}

std::string ResponseCache::canonicalize(const json::value& payload) {
    return json::serialize(sorted_copy(payload));
}

std::string ResponseCache::fingerprint(const std::string& method,
                                       const std::string& endpoint,
                                       const json::value* payload) {
    std::string key;
    key.reserve(method.size() + endpoint.size() + 8);
    for (unsigned char c : method) {
        key += static_cast<char>(std::toupper(c));
    }
    key += ' ';

    // Spaces delimit the three fields, so none may survive inside the endpoint.
    for (char c : endpoint) {
        if (c == ' ') {
            key += "%20";
        } else {
            key += c;
        }
    }
    key += ' ';

    key += payload ? canonicalize(*payload) : "null";
    return key;
}

std::optional<std::string> ResponseCache::lookup(const std::string& method,
                                                 const std::string& endpoint,
                                                 const json::value* payload) {
    auto hit = store_.get_cache(fingerprint(method, endpoint, payload));
    if (hit) {
        MetricsRegistry::instance().increment_counter("cache_hits_total");
    } else {
        MetricsRegistry::instance().increment_counter("cache_misses_total");
        Logger::log(Logger::Level::DEBUG, Logger::EventType::CACHE, "Cache miss for " + endpoint);
    }
    return hit;
}

void ResponseCache::store(const std::string& method,
                          const std::string& endpoint,
                          const json::value* payload,
                          const std::string& response_body) {
    store_.set_cache(fingerprint(method, endpoint, payload), response_body);
}

}
