#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/streambuf.hpp>
#include <array>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <sys/types.h>

#include "errors.hpp"
#include "generator.hpp"
#include "pool_config.hpp"

namespace net = boost::asio;

namespace credpool {

 
// Owns one long-lived external generator process and speaks its line protocol:
//   <- READY                 once, after spawn
//   -> cluster <N>\n         one request
//   <- [diagnostics]["a",..] one response line, JSON array after the first '['
//
// Two independent locks: comm_mutex_ serializes every request/response cycle
// (and start/stop, which also use the pipes); lifecycle_mutex_ guards the
// state and pid seen by observers. Any IPC failure tears the process down;
// the next request restarts it.
class GeneratorProcess : public CredentialGenerator {
public:
    enum class State {
        Stopped,
        Starting,
        Ready,
        Busy,
        Stopping,
        Failed
    };

    explicit GeneratorProcess(const PoolConfig& config);
    ~GeneratorProcess() override;

    GeneratorProcess(const GeneratorProcess&) = delete;
    GeneratorProcess& operator=(const GeneratorProcess&) = delete;

    void start() override;
    std::vector<std::string> request_batch(int cluster_size) override;
    void stop() override;
    bool is_running() const override;

    State state() const;
    pid_t pid() const;

    // --- Wire format ---
    static std::string format_command(int cluster_size);

    /**
     * Extracts the credential list from one response line. Text before the
     * first '[' is ignored; empty strings are dropped.
     * @throws GeneratorIPCError if no array is found or it is malformed.
     */
    static std::vector<std::string> parse_batch(const std::string& line);

    static const char* state_name(State state);

private:
    using Clock = std::chrono::steady_clock;
    static constexpr std::size_t STDERR_TAIL_LIMIT = 4096;

    const std::string path_;
    const std::vector<std::string> args_;
    const std::string ready_token_;
    const std::chrono::milliseconds startup_timeout_;
    const std::chrono::milliseconds request_timeout_;
    const std::chrono::milliseconds shutdown_grace_;

    net::io_context io_;
    net::posix::stream_descriptor stdin_;
    net::posix::stream_descriptor stdout_;
    net::posix::stream_descriptor stderr_;
    net::streambuf stdout_buf_;
    std::array<char, 512> stderr_chunk_{};
    std::string stderr_tail_;
    bool stderr_eof_ = true;

    pid_t pid_ = -1;
    State state_ = State::Stopped;
    mutable std::mutex lifecycle_mutex_;
    std::mutex comm_mutex_;

    // All of the following require comm_mutex_.
    void ensure_started();
    void spawn();
    std::string read_line(std::chrono::milliseconds timeout, boost::system::error_code& ec);
    void drain_stderr();
    void run_until(const std::function<bool()>& done, Clock::time_point deadline);
    void teardown(State final_state);
    void close_pipes();
    bool child_exited();
    GeneratorIPCError ipc_failure(const std::string& reason);

    void set_state(State state);
};

}
