#pragma once

#include <string>
#include <stdexcept>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>

namespace credpool {

// W3C trace-context identifiers attached to every outbound request.
class TraceContext {
public:
    // Returns "00-<trace-id>-<span-id>-01" with a sampled flag.
    static std::string generate_traceparent() {
        return "00-" + random_hex(16) + "-" + random_hex(8) + "-01";
    }

    // Hex encoding of `bytes` bytes from the OpenSSL CSPRNG.
    static std::string random_hex(int bytes) {
        unsigned char buffer[32];
        if (bytes <= 0 || bytes > static_cast<int>(sizeof(buffer))) {
            throw std::invalid_argument("random_hex: unsupported length");
        }
        if (RAND_bytes(buffer, bytes) != 1) {
            throw std::runtime_error("CSPRNG Failure - Entropy Exhausted");
        }

        std::stringstream ss;
        for (int i = 0; i < bytes; ++i) {
            ss << std::hex << std::setw(2) << std::setfill('0') << (int)buffer[i];
        }
        return ss.str();
    }
};

}
