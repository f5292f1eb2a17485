#pragma once

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "PipeTransport is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include "mcpwire/transport.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace mcpwire {

// ═══════════════════════════════════════════════════════════════════════════
// Pipe Transport Configuration
// ═══════════════════════════════════════════════════════════════════════════

enum class StderrHandling {
    Discard,     // child stderr goes to /dev/null
    Passthrough, // child inherits our stderr
    Capture      // buffered, see PipeTransport::read_stderr()
};

enum class PipeMode {
    Spawn,  // run `command` and talk over its stdin/stdout
    Attach  // use descriptors that already exist, our own stdin/stdout by default
};

using StderrCallback = std::function<void(std::string_view)>;

struct PipeTransportConfig {
    PipeMode mode{PipeMode::Spawn};

    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> environment;  // added to / overriding our environment
    std::optional<std::string> working_directory;

    std::size_t max_message_size{4 * 1024 * 1024};
    std::chrono::milliseconds read_timeout{0};          // 0 = block until a line arrives
    std::chrono::milliseconds close_grace_period{2000};  // SIGTERM -> SIGKILL window

    StderrHandling stderr_handling{StderrHandling::Discard};
    StderrCallback stderr_callback;  // Capture only; invoked on the stderr thread

    // Rejects shell metacharacters and unexpected absolute paths unless set.
    bool skip_command_validation{false};

    // Attach mode only. The transport owns both descriptors once open() succeeds
    // and closes them in close(), so an attached transport cannot be reopened.
    int attach_read_fd{0};
    int attach_write_fd{1};

    [[nodiscard]] static PipeTransportConfig attached(int read_fd = 0, int write_fd = 1) {
        PipeTransportConfig config;
        config.mode = PipeMode::Attach;
        config.attach_read_fd = read_fd;
        config.attach_write_fd = write_fd;
        return config;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Pipe Transport
// ═══════════════════════════════════════════════════════════════════════════
// Exchanges newline-delimited messages over a pair of pipes. In Spawn mode each
// open() starts a fresh subordinate process and close() ends it, escalating from
// EOF + SIGTERM to SIGKILL after close_grace_period. In Attach mode the transport
// serves over existing descriptors (the peer side of a pipe) and close() only
// releases them.
//
// send() never holds the state mutex while it writes: a peer that stops reading
// stalls the sender alone, and close() wakes it through the wake pipe.

class PipeTransport final : public ITransport {
public:
    explicit PipeTransport(PipeTransportConfig config);
    ~PipeTransport() override;

    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;
    PipeTransport(PipeTransport&&) = delete;
    PipeTransport& operator=(PipeTransport&&) = delete;

    [[nodiscard]] TransportKind kind() const noexcept override { return TransportKind::Pipe; }

    [[nodiscard]] TransportResult<void> open() override;
    [[nodiscard]] TransportResult<void> send(std::string_view payload) override;
    [[nodiscard]] TransportResult<std::string> receive() override;
    [[nodiscard]] TransportResult<void> probe(std::chrono::milliseconds deadline) override;
    TransportResult<void> close() override;
    [[nodiscard]] bool is_open() const noexcept override;

    [[nodiscard]] bool is_process_alive() const;

    /// Exit status of the last process: the exit code, or -signal if killed.
    [[nodiscard]] std::optional<int> exit_code() const;

    [[nodiscard]] std::optional<pid_t> pid() const;

    /// Drains captured stderr (Capture mode only).
    [[nodiscard]] std::string read_stderr();

    [[nodiscard]] const PipeTransportConfig& config() const noexcept { return config_; }

private:
    // Must be called with mutex_ held.
    [[nodiscard]] TransportResult<void> spawn_process();
    [[nodiscard]] TransportResult<void> attach_descriptors();
    [[nodiscard]] TransportResult<void> write_all(int fd, int wake_fd, std::string_view data);
    void stderr_reader_loop(int fd, int wake_fd);
    [[nodiscard]] TransportResult<std::size_t> fill_read_buffer();
    // Must be called with mutex_ held.
    void reap_if_exited();
    [[nodiscard]] std::string exit_description() const;
    void terminate_child(pid_t pid);

    PipeTransportConfig config_;

    // Process and descriptor state
    mutable std::mutex mutex_;
    pid_t child_pid_{-1};
    int write_fd_{-1};   // child's stdin, or the attached write descriptor
    int read_fd_{-1};    // child's stdout, or the attached read descriptor
    int stderr_fd_{-1};
    int wake_read_fd_{-1};   // close() writes to wake_write_fd_ to unblock poll()
    int wake_write_fd_{-1};
    bool open_{false};
    bool attached_released_{false};
    std::optional<int> exit_code_;

    // Held by send() for its whole duration, taken before mutex_. close() takes
    // it after waking the writer so write_fd_ is never closed under a writer.
    std::mutex write_mutex_;

    // Held by receive() for its whole duration; close() takes it to know the
    // reader has left poll()/read() before the descriptors are released.
    std::mutex read_mutex_;
    static constexpr std::size_t kReadBufferSize = 8192;
    char read_buffer_[kReadBufferSize];
    std::size_t read_buffer_pos_{0};
    std::size_t read_buffer_len_{0};
    std::string partial_line_;
    bool discarding_line_{false};

    std::thread stderr_thread_;
    std::string stderr_buffer_;
    std::mutex stderr_mutex_;
};

}  // namespace mcpwire
