#include "generator_process.hpp"
#include "logger.hpp"
#include "metrics.hpp"

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <boost/json.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace json = boost::json;

namespace credpool {

namespace {

// Owns both ends of a pipe until they are handed over.
struct PipePair {
    int fds[2] = {-1, -1};

    ~PipePair() {
        for (int& fd : fds) {
            if (fd >= 0) ::close(fd);
        }
    }

    void open(const char* name) {
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw GeneratorStartupError(std::string("pipe2 failed for ") + name + ": " + std::strerror(errno));
        }
    }

    int release(int index) {
        int fd = fds[index];
        fds[index] = -1;
        return fd;
    }
};

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string preview(const std::string& s, std::size_t max_length = 120) {
    if (s.size() <= max_length) return s;
    return s.substr(0, max_length) + "...";
}

}

GeneratorProcess::GeneratorProcess(const PoolConfig& config)
    : path_(config.generator_path)
    , args_(config.generator_args)
    , ready_token_(config.ready_token)
    , startup_timeout_(config.startup_timeout_ms)
    , request_timeout_(config.request_timeout_ms)
    , shutdown_grace_(config.shutdown_grace_ms)
    , stdin_(io_)
    , stdout_(io_)
    , stderr_(io_) {
}

GeneratorProcess::~GeneratorProcess() {
    stop();
}

std::string GeneratorProcess::format_command(int cluster_size) {
    return "cluster " + std::to_string(cluster_size) + "\n";
}

std::vector<std::string> GeneratorProcess::parse_batch(const std::string& line) {
    auto start = line.find('[');
    if (start == std::string::npos) {
        throw GeneratorIPCError("could not find JSON in generator output: " + preview(line));
    }

    json::value parsed;
    try {
        json::parse_options opt;
        opt.max_depth = 4;
        parsed = json::parse(line.substr(start), {}, opt);
    } catch (const std::exception& e) {
        throw GeneratorIPCError("unparsable generator output (" + std::string(e.what()) + "): " + preview(line));
    }

    std::vector<std::string> batch;
    for (const auto& item : parsed.as_array()) {
        if (!item.is_string()) {
            throw GeneratorIPCError("generator output contains a non-string credential: " + preview(line));
        }
        const auto& s = item.as_string();
        if (!s.empty()) {
            batch.emplace_back(s.data(), s.size());
        }
    }
    return batch;
}

const char* GeneratorProcess::state_name(State state) {
    switch (state) {
        case State::Stopped: return "stopped";
        case State::Starting: return "starting";
        case State::Ready: return "ready";
        case State::Busy: return "busy";
        case State::Stopping: return "stopping";
        case State::Failed: return "failed";
        default: return "unknown";
    }
}

GeneratorProcess::State GeneratorProcess::state() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return state_;
}

pid_t GeneratorProcess::pid() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return pid_;
}

bool GeneratorProcess::is_running() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return state_ == State::Ready || state_ == State::Busy;
}

void GeneratorProcess::set_state(State state) {
    State previous;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        previous = state_;
        state_ = state;
    }
    if (previous != state) {
        Logger::log(Logger::Level::DEBUG, Logger::EventType::GENERATOR,
                    std::string("State ") + state_name(previous) + " -> " + state_name(state));
    }
}

void GeneratorProcess::start() {
    std::lock_guard<std::mutex> comm(comm_mutex_);
    ensure_started();
}

std::vector<std::string> GeneratorProcess::request_batch(int cluster_size) {
    if (cluster_size < 1) {
        throw std::invalid_argument("cluster_size must be positive");
    }

    std::lock_guard<std::mutex> comm(comm_mutex_);
    ensure_started();
    set_state(State::Busy);

    boost::system::error_code ec;
    std::string command = format_command(cluster_size);
    net::write(stdin_, net::buffer(command), ec);
    if (ec) {
        throw ipc_failure("write to generator failed: " + ec.message());
    }

    std::string line = read_line(request_timeout_, ec);
    if (ec == net::error::timed_out) {
        throw ipc_failure("timed out waiting for a batch");
    }
    if (ec) {
        throw ipc_failure("generator closed its output unexpectedly (" + ec.message() + ")");
    }

    std::vector<std::string> batch;
    try {
        batch = parse_batch(line);
    } catch (const GeneratorIPCError& e) {
        throw ipc_failure(e.what());
    }

    set_state(State::Ready);
    MetricsRegistry::instance().increment_counter("generator_batches_total");
    Logger::log(Logger::Level::DEBUG, Logger::EventType::IPC,
                "Received " + std::to_string(batch.size()) + " credentials");
    return batch;
}

void GeneratorProcess::stop() {
    std::lock_guard<std::mutex> comm(comm_mutex_);

    pid_t pid = this->pid();
    if (pid <= 0) {
        set_state(State::Stopped);
        return;
    }
    set_state(State::Stopping);

    Logger::log(Logger::Level::INFO, Logger::EventType::GENERATOR,
                "Closing generator (pid " + std::to_string(pid) + ")");

    // Closing stdin gives well-behaved generators an EOF before the signal.
    boost::system::error_code ignored;
    stdin_.close(ignored);
    ::kill(pid, SIGTERM);

    bool exited = false;
    auto deadline = Clock::now() + shutdown_grace_;
    while (true) {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno == ECHILD)) {
            exited = true;
            break;
        }
        if (Clock::now() >= deadline) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (!exited) {
        Logger::log(Logger::Level::WARNING, Logger::EventType::GENERATOR,
                    "Generator ignored SIGTERM for " + std::to_string(shutdown_grace_.count()) + "ms, killing");
        ::kill(pid, SIGKILL);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }

    close_pipes();
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        pid_ = -1;
    }
    set_state(State::Stopped);
    Logger::log(Logger::Level::INFO, Logger::EventType::GENERATOR, "Generator closed");
}

// Starts the process unless a live, ready one already exists.
void GeneratorProcess::ensure_started() {
    State current = state();
    if (current == State::Ready) {
        if (!child_exited()) return;
        Logger::log(Logger::Level::WARNING, Logger::EventType::GENERATOR,
                    "Generator exited while idle, restarting");
        teardown(State::Failed);
    }

    set_state(State::Starting);
    Logger::log(Logger::Level::INFO, Logger::EventType::GENERATOR, "Starting generator: " + path_);

    try {
        spawn();
    } catch (const GeneratorStartupError&) {
        set_state(State::Failed);
        MetricsRegistry::instance().increment_counter("generator_failures_total");
        throw;
    }
    drain_stderr();

    boost::system::error_code ec;
    std::string line = read_line(startup_timeout_, ec);

    std::string reason;
    if (ec == net::error::timed_out) {
        reason = "timed out waiting for " + ready_token_;
    } else if (ec) {
        reason = "output closed before " + ready_token_ + " (" + ec.message() + ")";
    } else if (trim(line) != ready_token_) {
        reason = "unexpected readiness line: " + preview(line);
    }

    if (!reason.empty()) {
        teardown(State::Failed);
        MetricsRegistry::instance().increment_counter("generator_failures_total");
        Logger::log(Logger::Level::ERROR, Logger::EventType::GENERATOR, "Generator failed to start: " + reason);
        throw GeneratorStartupError("generator failed to start: " + reason, stderr_tail_);
    }

    set_state(State::Ready);
    MetricsRegistry::instance().increment_counter("generator_starts_total");
    Logger::log(Logger::Level::INFO, Logger::EventType::GENERATOR,
                "Generator is ready (pid " + std::to_string(pid()) + ")");
}

void GeneratorProcess::spawn() {
    if (::access(path_.c_str(), X_OK) != 0) {
        throw GeneratorStartupError("generator is not executable: " + path_ + " (" + std::strerror(errno) + ")");
    }

    // Broken pipes must surface as EPIPE on write, not terminate the host process.
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });

    PipePair in_pipe, out_pipe, err_pipe;
    in_pipe.open("stdin");
    out_pipe.open("stdout");
    err_pipe.open("stderr");

    // argv is built before fork; the child only makes async-signal-safe calls.
    std::vector<char*> argv;
    argv.reserve(args_.size() + 2);
    argv.push_back(const_cast<char*>(path_.c_str()));
    for (const auto& arg : args_) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t child = ::fork();
    if (child < 0) {
        throw GeneratorStartupError(std::string("fork failed: ") + std::strerror(errno));
    }

    if (child == 0) {
        ::dup2(in_pipe.fds[0], STDIN_FILENO);
        ::dup2(out_pipe.fds[1], STDOUT_FILENO);
        ::dup2(err_pipe.fds[1], STDERR_FILENO);
        ::execv(argv[0], argv.data());

        static const char msg[] = "exec failed\n";
        ssize_t written = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)written;
        ::_exit(127);
    }

    stdin_.assign(in_pipe.release(1));
    stdout_.assign(out_pipe.release(0));
    stderr_.assign(err_pipe.release(0));

    stdout_buf_.consume(stdout_buf_.size());
    stderr_tail_.clear();
    stderr_eof_ = false;

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    pid_ = child;
}

std::string GeneratorProcess::read_line(std::chrono::milliseconds timeout, boost::system::error_code& ec) {
    bool done = false;
    std::size_t length = 0;
    ec = {};

    net::async_read_until(stdout_, stdout_buf_, '\n',
        [&done, &length, &ec](const boost::system::error_code& e, std::size_t n) {
            ec = e;
            length = n;
            done = true;
        });

    run_until([&done] { return done; }, Clock::now() + timeout);

    if (!done) {
        // The handler still references this frame; let it complete as aborted.
        boost::system::error_code ignored;
        stdout_.cancel(ignored);
        io_.restart();
        while (!done && io_.run_one() > 0) {}
        ec = net::error::timed_out;
        return "";
    }
    if (ec) return "";

    auto begin = net::buffers_begin(stdout_buf_.data());
    std::string line(begin, begin + static_cast<std::ptrdiff_t>(length));
    stdout_buf_.consume(length);

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    return line;
}

// Keeps a bounded tail of the generator's stderr; progresses whenever io_ runs.
void GeneratorProcess::drain_stderr() {
    stderr_.async_read_some(net::buffer(stderr_chunk_),
        [this](const boost::system::error_code& ec, std::size_t n) {
            if (n > 0) {
                stderr_tail_.append(stderr_chunk_.data(), n);
                if (stderr_tail_.size() > STDERR_TAIL_LIMIT) {
                    stderr_tail_.erase(0, stderr_tail_.size() - STDERR_TAIL_LIMIT);
                }
            }
            if (ec) {
                stderr_eof_ = true;
                return;
            }
            drain_stderr();
        });
}

void GeneratorProcess::run_until(const std::function<bool()>& done, Clock::time_point deadline) {
    io_.restart();
    while (!done()) {
        if (io_.run_one_until(deadline) == 0) break;
    }
}

bool GeneratorProcess::child_exited() {
    pid_t pid = this->pid();
    if (pid <= 0) return true;
    int status = 0;
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
        // Reaped here; teardown must not wait on it again.
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        pid_ = -1;
        return true;
    }
    return r < 0 && errno == ECHILD;
}

// Force-kills the process, collects what is left of its stderr and releases the pipes.
void GeneratorProcess::teardown(State final_state) {
    pid_t pid = this->pid();
    if (pid > 0) {
        ::kill(pid, SIGKILL);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }

    if (stderr_.is_open()) {
        run_until([this] { return stderr_eof_; }, Clock::now() + std::chrono::milliseconds(250));
    }
    close_pipes();

    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        pid_ = -1;
    }
    set_state(final_state);
}

void GeneratorProcess::close_pipes() {
    boost::system::error_code ignored;
    stdin_.close(ignored);
    stdout_.close(ignored);
    stderr_.close(ignored);

    // Run the aborted completions so no handler outlives the descriptors.
    io_.restart();
    io_.poll();
    stdout_buf_.consume(stdout_buf_.size());
}

GeneratorIPCError GeneratorProcess::ipc_failure(const std::string& reason) {
    Logger::log(Logger::Level::WARNING, Logger::EventType::IPC,
                "Error communicating with generator: " + reason + ". Restarting on next call.");
    MetricsRegistry::instance().increment_counter("generator_failures_total");
    teardown(State::Failed);
    return GeneratorIPCError(reason, stderr_tail_);
}

}
