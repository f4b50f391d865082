#pragma once

#include <string>
#include <vector>

namespace credpool {

// Narrow seam around the external credential generator. The pool manager
// only ever talks to this interface, so tests can swap in scripted batches.
class CredentialGenerator {
public:
    virtual ~CredentialGenerator() = default;

    // Brings the generator to a ready state. No-op if already running.
    virtual void start() = 0;

    /**
     * Requests one batch of fresh credentials, starting the generator first if needed.
     * @param cluster_size Positive batch multiplier.
     * @throws GeneratorStartupError, GeneratorIPCError
     */
    virtual std::vector<std::string> request_batch(int cluster_size) = 0;

    // Shuts the generator down. Idempotent.
    virtual void stop() = 0;

    virtual bool is_running() const = 0;
};

}
