#include "runtime/exec_session.hpp"
#include "runtime/cancellation_token.hpp"
#include "docker/errors.hpp"
#include "docker/stream_demuxer.hpp"
#include "util/strings.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace sandkit::runtime {

namespace {

// $0 is the pid file, "$@" the guest argv. With setsid the recorded pid is
// also the process group id, so a kill reaches every descendant.
const char* SESSION_WRAPPER = R"SH(pidfile="$0"
if setsid -w true >/dev/null 2>&1; then
  exec setsid -w sh -c 'echo $$ > "$0"; exec "$@"' "$pidfile" "$@"
fi
echo $$ > "$pidfile"
exec "$@")SH";

constexpr size_t READ_CHUNK = 64 * 1024;
constexpr int EXIT_STATUS_POLLS = 100;
constexpr auto EXIT_STATUS_POLL_MIN = std::chrono::milliseconds(10);
constexpr auto EXIT_STATUS_POLL_MAX = std::chrono::milliseconds(200);

using Clock = std::chrono::steady_clock;

struct OutputBuffer {
    std::string data;
    bool truncated = false;

    void append(const char* bytes, size_t len, size_t max_bytes) {
        size_t room = data.size() < max_bytes ? max_bytes - data.size() : 0;
        if (len > room) {
            truncated = true;
            len = room;
        }
        data.append(bytes, len);
    }
};

struct ReaderState {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    std::exception_ptr error;
    OutputBuffer out;
    OutputBuffer err;
};

// Joins the reader on every exit path; the stream is aborted first so a
// blocked read returns
class ReaderGuard {
public:
    ReaderGuard(std::thread& thread, docker::ExecStream& stream)
        : thread_(thread), stream_(stream) {}
    ~ReaderGuard() {
        if (thread_.joinable()) {
            stream_.abort();
            thread_.join();
        }
    }

    ReaderGuard(const ReaderGuard&) = delete;
    ReaderGuard& operator=(const ReaderGuard&) = delete;

private:
    std::thread& thread_;
    docker::ExecStream& stream_;
};

// Poll until the exec reports an exit status. Returns nullopt when the
// deadline passes first. A stopped exec without a status is retried a
// bounded number of times; a running one is waited for up to the deadline.
std::optional<int> wait_for_exit_code(docker::ContainerRuntime& runtime,
                                      const std::string& exec_id,
                                      const std::optional<Clock::time_point>& deadline) {
    auto interval = EXIT_STATUS_POLL_MIN;
    int missing_status = 0;
    while (true) {
        auto state = runtime.inspect_exec(exec_id);
        if (!state.running) {
            if (state.exit_code) {
                return *state.exit_code;
            }
            if (++missing_status >= EXIT_STATUS_POLLS) {
                throw docker::TransportError("exec " + util::short_id(exec_id) +
                                             " stopped but reports no exit status");
            }
            interval = EXIT_STATUS_POLL_MIN;
        }

        auto now = Clock::now();
        if (deadline && now >= *deadline) {
            return std::nullopt;
        }
        auto pause = interval;
        if (deadline && *deadline - now < pause) {
            pause = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now) +
                    std::chrono::milliseconds(1);
        }
        std::this_thread::sleep_for(pause);
        if (state.running) {
            interval = std::min(interval * 2, EXIT_STATUS_POLL_MAX);
        }
    }
}

} // namespace

std::vector<std::string> session_command(const std::string& pid_file,
                                         const std::vector<std::string>& argv) {
    std::vector<std::string> command = {"sh", "-c", SESSION_WRAPPER, pid_file};
    command.insert(command.end(), argv.begin(), argv.end());
    return command;
}

ExecOutcome run_exec(docker::ContainerRuntime& runtime,
                     const std::string& container_id,
                     const docker::ExecSpec& spec,
                     const ExecOptions& options) {
    if (options.timeout && options.pid_file.empty()) {
        throw std::invalid_argument("run_exec: a timeout requires a pid file");
    }

    auto started = Clock::now();
    auto exec_id = runtime.create_exec(container_id, spec);
    std::unique_ptr<docker::ExecStream> stream = runtime.start_exec(exec_id);
    spdlog::debug("exec {} started in {}", util::short_id(exec_id), util::short_id(container_id));

    // The deadline side cancels; the invocation answers by killing its
    // process group inside the environment
    CancellationToken token;
    token.on_cancel([&runtime, &container_id, &options] {
        try {
            runtime.kill_process(container_id, options.pid_file);
        } catch (const std::exception& e) {
            spdlog::warn("Failed to kill timed-out process in {}: {}",
                         util::short_id(container_id), e.what());
        }
    });

    ReaderState state;
    docker::ExecStream* raw = stream.get();
    const size_t max_bytes = options.max_output_bytes;

    std::thread reader([raw, &state, max_bytes] {
        docker::StreamDemuxer demux([&state, max_bytes](docker::StreamId id, const char* data, size_t len) {
            std::lock_guard<std::mutex> lock(state.mutex);
            if (id == docker::StreamId::STDERR) {
                state.err.append(data, len, max_bytes);
            } else if (id == docker::StreamId::STDOUT) {
                state.out.append(data, len, max_bytes);
            }
        });

        std::exception_ptr error;
        try {
            std::vector<char> buf(READ_CHUNK);
            size_t n;
            while ((n = raw->read_some(buf.data(), buf.size())) > 0) {
                demux.feed(buf.data(), n);
            }
        } catch (const std::exception&) {
            error = std::current_exception();
        }

        std::lock_guard<std::mutex> lock(state.mutex);
        state.error = error;
        state.done = true;
        state.cv.notify_all();
    });
    ReaderGuard guard(reader, *raw);

    std::optional<Clock::time_point> deadline;
    if (options.timeout) {
        deadline = started + std::min(*options.timeout, MAX_EXEC_TIMEOUT);
    }

    bool timed_out = false;
    {
        std::unique_lock<std::mutex> lock(state.mutex);
        if (deadline) {
            timed_out = !state.cv.wait_until(lock, *deadline, [&state] { return state.done; });
        } else {
            state.cv.wait(lock, [&state] { return state.done; });
        }
    }

    if (timed_out) {
        spdlog::debug("exec {} exceeded {}ms, killing", util::short_id(exec_id),
                      options.timeout->count());
        token.cancel();

        std::unique_lock<std::mutex> lock(state.mutex);
        if (!state.cv.wait_for(lock, options.kill_grace, [&state] { return state.done; })) {
            lock.unlock();
            spdlog::warn("exec {} still attached {}ms after kill, aborting stream",
                         util::short_id(exec_id), options.kill_grace.count());
            raw->abort();
        }
    }
    reader.join();

    ExecOutcome outcome;
    outcome.stdout_data = std::move(state.out.data);
    outcome.stderr_data = std::move(state.err.data);
    outcome.output_truncated = state.out.truncated || state.err.truncated;

    std::optional<int> exit_code;
    if (!timed_out) {
        if (state.error) {
            std::rethrow_exception(state.error);
        }
        // End of output is not end of process
        exit_code = wait_for_exit_code(runtime, exec_id, deadline);
        if (!exit_code) {
            spdlog::debug("exec {} closed its output but outlived {}ms, killing",
                          util::short_id(exec_id), options.timeout->count());
            token.cancel();
            timed_out = true;
        }
    }

    if (timed_out) {
        // Read errors after a kill are expected (aborted connection)
        outcome.timed_out = true;
        outcome.exit_code = TIMED_OUT_EXIT_CODE;
    } else {
        outcome.exit_code = *exit_code;
    }

    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - started);
    spdlog::debug("exec {} finished: exit={} timed_out={} elapsed={}ms",
                  util::short_id(exec_id), outcome.exit_code, outcome.timed_out,
                  outcome.elapsed.count());
    return outcome;
}

} // namespace sandkit::runtime
