#include "mcpwire/transport/pipe_transport.hpp"
#include "mcpwire/log/logger.hpp"

#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>

extern char** environ;

namespace mcpwire {

namespace {

constexpr std::string_view kLog = "pipe";
constexpr std::size_t kMaxCapturedStderr = 64 * 1024;
constexpr auto kReapPollInterval = std::chrono::milliseconds(10);

const std::vector<std::string> kAllowedCommandPrefixes = {
    "/usr/bin/", "/usr/local/bin/", "/bin/", "/usr/sbin/", "/sbin/",
    "/snap/bin/", "/opt/", "/home/"
};

bool is_safe_command(const std::string& command, const std::vector<std::string>& args) {
    if (command.empty()) {
        return false;
    }

    const std::string_view dangerous_chars = ";|&$`\\\"'<>(){}[]!#~";
    const auto has_dangerous = [&](const std::string& text) {
        return text.find_first_of(dangerous_chars) != std::string::npos;
    };
    if (has_dangerous(command)) {
        return false;
    }
    for (const auto& arg : args) {
        if (has_dangerous(arg)) {
            return false;
        }
    }

    // Relative commands resolve through PATH; absolute ones must live somewhere expected.
    const bool is_absolute = (command.front() == '/');
    if (is_absolute) {
        return std::any_of(kAllowedCommandPrefixes.begin(), kAllowedCommandPrefixes.end(),
                           [&](const std::string& prefix) { return command.rfind(prefix, 0) == 0; });
    }
    return true;
}

std::string errno_text(int err) {
    return std::string(std::strerror(err));
}

void close_fd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

bool make_pipe(int fds[2]) {
    return ::pipe2(fds, O_CLOEXEC) == 0;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

// A child that exits while we are writing to it would otherwise kill us with
// SIGPIPE; with the signal ignored the write fails with EPIPE instead.
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, []() {
        ::signal(SIGPIPE, SIG_IGN);
        MCPWIRE_LOG_DEBUG(kLog, "SIGPIPE ignored for pipe transports");
    });
}

}  // namespace

PipeTransport::PipeTransport(PipeTransportConfig config)
    : config_(std::move(config))
{}

PipeTransport::~PipeTransport() {
    auto closed = close();
    if (closed.has_value() == false) {
        get_logger().warn_fmt(kLog, "close during destruction failed: {}", closed.error().message);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// open()
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> PipeTransport::open() {
    const bool spawning = (config_.mode == PipeMode::Spawn);
    const bool validation_required = spawning && (config_.skip_command_validation == false);
    if (validation_required && (is_safe_command(config_.command, config_.args) == false)) {
        return tl::unexpected(TransportError::protocol(
            "command validation failed: potentially unsafe command or arguments"));
    }

    std::lock_guard lock(mutex_);
    if (open_) {
        return tl::unexpected(TransportError::protocol(
            spawning ? "subordinate process already running" : "descriptors already attached"));
    }
    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }

    ignore_sigpipe_once();

    auto opened = spawning ? spawn_process() : attach_descriptors();
    if (opened.has_value() == false) {
        return opened;
    }

    read_buffer_pos_ = 0;
    read_buffer_len_ = 0;
    partial_line_.clear();
    discarding_line_ = false;
    open_ = true;
    return {};
}

TransportResult<void> PipeTransport::attach_descriptors() {
    if (attached_released_) {
        return tl::unexpected(TransportError::closed("attached descriptors were already closed"));
    }
    const int read_fd = config_.attach_read_fd;
    const int write_fd = config_.attach_write_fd;
    const bool valid = (read_fd >= 0) && (write_fd >= 0) &&
                       (::fcntl(read_fd, F_GETFD) != -1) && (::fcntl(write_fd, F_GETFD) != -1);
    if (valid == false) {
        return tl::unexpected(TransportError::network(
            "cannot attach to descriptors " + std::to_string(read_fd) + "/" + std::to_string(write_fd)));
    }

    int wake_pipe[2] = {-1, -1};
    if (make_pipe(wake_pipe) == false) {
        return tl::unexpected(TransportError::network("failed to create pipes: " + errno_text(errno)));
    }

    read_fd_ = read_fd;
    write_fd_ = write_fd;
    wake_read_fd_ = wake_pipe[0];
    wake_write_fd_ = wake_pipe[1];
    exit_code_.reset();

    get_logger().info_fmt(kLog, "attached to fd {} (read) / fd {} (write)", read_fd, write_fd);
    return {};
}

TransportResult<void> PipeTransport::spawn_process() {
    // Everything the child needs is allocated here: after fork() only
    // async-signal-safe calls are allowed (another thread may hold malloc's lock).
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    argv_storage.insert(argv_storage.end(), config_.args.begin(), config_.args.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** entry = environ; (entry != nullptr) && (*entry != nullptr); ++entry) {
        const std::string_view text(*entry);
        const auto name = text.substr(0, text.find('='));
        const bool overridden = config_.environment.contains(std::string(name));
        if (overridden == false) {
            env_storage.emplace_back(text);
        }
    }
    for (const auto& [name, value] : config_.environment) {
        env_storage.push_back(name + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const char* working_dir = config_.working_directory.has_value()
        ? config_.working_directory->c_str()
        : nullptr;
    const bool capture_stderr = (config_.stderr_handling == StderrHandling::Capture);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};  // reports exec failure; closed by exec on success
    int wake_pipe[2] = {-1, -1};

    const auto close_all = [&]() {
        for (int* fds : {stdin_pipe, stdout_pipe, stderr_pipe, status_pipe, wake_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };

    const bool pipes_ok = make_pipe(stdin_pipe) && make_pipe(stdout_pipe) &&
                          make_pipe(status_pipe) && make_pipe(wake_pipe) &&
                          ((capture_stderr == false) || make_pipe(stderr_pipe));
    if (pipes_ok == false) {
        const int err = errno;
        close_all();
        return tl::unexpected(TransportError::network("failed to create pipes: " + errno_text(err)));
    }

    // Our end of the child's stdin never blocks; send() waits in poll() instead.
    if (::fcntl(stdin_pipe[1], F_SETFL, ::fcntl(stdin_pipe[1], F_GETFL) | O_NONBLOCK) == -1) {
        const int err = errno;
        close_all();
        return tl::unexpected(TransportError::network("fcntl failed: " + errno_text(err)));
    }

    const pid_t pid = ::fork();
    if (pid == -1) {
        const int err = errno;
        close_all();
        return tl::unexpected(TransportError::network("fork failed: " + errno_text(err)));
    }

    if (pid == 0) {
        // Child: dup2 clears O_CLOEXEC on the targets, everything else closes on exec.
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        switch (config_.stderr_handling) {
            case StderrHandling::Discard: {
                const int devnull = ::open("/dev/null", O_WRONLY);
                if (devnull != -1) {
                    ::dup2(devnull, STDERR_FILENO);
                    ::close(devnull);
                }
                break;
            }
            case StderrHandling::Capture:
                ::dup2(stderr_pipe[1], STDERR_FILENO);
                break;
            case StderrHandling::Passthrough:
                break;
        }

        if ((working_dir != nullptr) && (::chdir(working_dir) != 0)) {
            const int err = errno;
            (void)::write(status_pipe[1], &err, sizeof(err));
            ::_exit(126);
        }

        environ = envp.data();
        ::execvp(argv[0], argv.data());

        const int err = errno;
        (void)::write(status_pipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    // Parent
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    int child_errno = 0;
    ssize_t status_bytes = 0;
    do {
        status_bytes = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while ((status_bytes == -1) && (errno == EINTR));
    close_fd(status_pipe[0]);

    if (status_bytes == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while ((::waitpid(pid, &status, 0) == -1) && (errno == EINTR)) {}
        exit_code_ = decode_wait_status(status);
        close_all();
        return tl::unexpected(TransportError::network(
            "failed to start '" + config_.command + "': " + errno_text(child_errno)));
    }

    child_pid_ = pid;
    write_fd_ = stdin_pipe[1];
    read_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];
    wake_read_fd_ = wake_pipe[0];
    wake_write_fd_ = wake_pipe[1];
    exit_code_.reset();

    if (capture_stderr) {
        stderr_thread_ = std::thread([this, fd = stderr_fd_, wake = wake_read_fd_]() {
            stderr_reader_loop(fd, wake);
        });
    }

    get_logger().info_fmt(kLog, "started '{}' (pid {})", config_.command, pid);
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// close()
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> PipeTransport::close() {
    pid_t pid = -1;
    {
        std::lock_guard lock(mutex_);
        if (open_ == false) {
            return {};
        }
        open_ = false;
        pid = child_pid_;
        child_pid_ = -1;

        // Wake send(), receive() and the stderr reader out of poll(). The byte is
        // never drained, so every later poll() on the wake pipe returns at once.
        const char byte = 1;
        (void)::write(wake_write_fd_, &byte, 1);
    }

    {
        // EOF on stdin is the polite shutdown request.
        std::lock_guard write_lock(write_mutex_);
        std::lock_guard lock(mutex_);
        close_fd(write_fd_);
    }

    terminate_child(pid);

    {
        std::lock_guard read_lock(read_mutex_);
        std::lock_guard lock(mutex_);
        close_fd(read_fd_);
        read_buffer_pos_ = 0;
        read_buffer_len_ = 0;
        partial_line_.clear();
        discarding_line_ = false;
    }

    if (stderr_thread_.joinable()) {
        stderr_thread_.join();
    }

    std::string outcome;
    {
        std::lock_guard lock(mutex_);
        close_fd(stderr_fd_);
        close_fd(wake_read_fd_);
        close_fd(wake_write_fd_);
        if (config_.mode == PipeMode::Attach) {
            attached_released_ = true;
        }
        outcome = exit_description();
    }

    if (config_.mode == PipeMode::Attach) {
        MCPWIRE_LOG_INFO(kLog, "detached");
    } else {
        get_logger().info_fmt(kLog, "stopped '{}' ({})", config_.command, outcome);
    }
    return {};
}

void PipeTransport::terminate_child(pid_t pid) {
    if (pid <= 0) {
        return;
    }

    const auto record = [this](int status) {
        std::lock_guard lock(mutex_);
        exit_code_ = decode_wait_status(status);
    };

    ::kill(pid, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + config_.close_grace_period;
    while (true) {
        int status = 0;
        const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            record(status);
            return;
        }
        if ((reaped == -1) && (errno != EINTR)) {
            return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }

    get_logger().warn_fmt(kLog, "pid {} ignored SIGTERM for {} ms, sending SIGKILL",
                          pid, config_.close_grace_period.count());
    ::kill(pid, SIGKILL);
    int status = 0;
    while ((::waitpid(pid, &status, 0) == -1) && (errno == EINTR)) {}
    record(status);
}

// ─────────────────────────────────────────────────────────────────────────────
// send() / receive()
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> PipeTransport::send(std::string_view payload) {
    std::string frame;
    frame.reserve(payload.size() + 1);
    frame.append(payload);
    frame.push_back('\n');

    std::lock_guard write_lock(write_mutex_);
    int write_fd = -1;
    int wake_fd = -1;
    {
        std::lock_guard lock(mutex_);
        if (open_ == false) {
            return tl::unexpected(TransportError::closed());
        }
        reap_if_exited();
        if ((config_.mode == PipeMode::Spawn) && (child_pid_ == -1)) {
            return tl::unexpected(TransportError::closed(exit_description()));
        }
        write_fd = write_fd_;
        wake_fd = wake_read_fd_;
    }

    auto written = write_all(write_fd, wake_fd, frame);
    if (written.has_value() == false) {
        return written;
    }

    get_logger().trace_fmt(kLog, "sent {} bytes", payload.size());
    return {};
}

TransportResult<void> PipeTransport::write_all(int fd, int wake_fd, std::string_view data) {
    while (data.empty() == false) {
        pollfd fds[2]{};
        fds[0].fd = fd;
        fds[0].events = POLLOUT;
        fds[1].fd = wake_fd;
        fds[1].events = POLLIN;

        const int ready = ::poll(fds, 2, -1);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            return tl::unexpected(TransportError::network("poll failed: " + errno_text(errno)));
        }
        if ((fds[1].revents & POLLIN) != 0) {
            return tl::unexpected(TransportError::closed());
        }

        // At most PIPE_BUF per write: POLLOUT guarantees that much room, so an
        // attached descriptor left in blocking mode does not stall here either.
        const std::size_t chunk = std::min<std::size_t>(data.size(), PIPE_BUF);
        const ssize_t written = ::write(fd, data.data(), chunk);
        if (written == -1) {
            if ((errno == EINTR) || (errno == EAGAIN) || (errno == EWOULDBLOCK)) {
                continue;
            }
            if (errno == EPIPE) {
                return tl::unexpected(TransportError::closed(
                    (config_.mode == PipeMode::Spawn) ? "subordinate process closed its input"
                                                      : "peer closed its input"));
            }
            return tl::unexpected(TransportError::network("write failed: " + errno_text(errno)));
        }
        data.remove_prefix(static_cast<std::size_t>(written));
    }
    return {};
}

TransportResult<std::string> PipeTransport::receive() {
    std::lock_guard read_lock(read_mutex_);

    while (true) {
        while (read_buffer_pos_ < read_buffer_len_) {
            const char* start = read_buffer_ + read_buffer_pos_;
            const std::size_t available = read_buffer_len_ - read_buffer_pos_;
            const auto* newline = static_cast<const char*>(std::memchr(start, '\n', available));
            const std::size_t take = (newline != nullptr)
                ? static_cast<std::size_t>(newline - start)
                : available;

            read_buffer_pos_ += take;

            // Tail of a line already reported as oversized.
            if (discarding_line_) {
                if (newline == nullptr) {
                    break;
                }
                ++read_buffer_pos_;
                discarding_line_ = false;
                continue;
            }

            partial_line_.append(start, take);
            if (partial_line_.size() > config_.max_message_size) {
                partial_line_.clear();
                discarding_line_ = (newline == nullptr);
                return tl::unexpected(TransportError::protocol(
                    "line exceeds " + std::to_string(config_.max_message_size) + " bytes"));
            }

            if (newline == nullptr) {
                break;
            }

            ++read_buffer_pos_;  // consume '\n'
            std::string line = std::move(partial_line_);
            partial_line_.clear();
            if ((line.empty() == false) && (line.back() == '\r')) {
                line.pop_back();
            }
            if (line.empty()) {
                continue;
            }
            get_logger().trace_fmt(kLog, "received {} bytes", line.size());
            return line;
        }

        auto filled = fill_read_buffer();
        if (filled.has_value() == false) {
            return tl::unexpected(filled.error());
        }
    }
}

TransportResult<std::size_t> PipeTransport::fill_read_buffer() {
    int out_fd = -1;
    int wake_fd = -1;
    {
        std::lock_guard lock(mutex_);
        if (open_ == false) {
            return tl::unexpected(TransportError::closed());
        }
        out_fd = read_fd_;
        wake_fd = wake_read_fd_;
    }

    const int timeout_ms = (config_.read_timeout.count() > 0)
        ? static_cast<int>(config_.read_timeout.count())
        : -1;

    while (true) {
        pollfd fds[2]{};
        fds[0].fd = out_fd;
        fds[0].events = POLLIN;
        fds[1].fd = wake_fd;
        fds[1].events = POLLIN;

        const int ready = ::poll(fds, 2, timeout_ms);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            return tl::unexpected(TransportError::network("poll failed: " + errno_text(errno)));
        }
        if (ready == 0) {
            return tl::unexpected(TransportError::timeout(
                "no data within " + std::to_string(config_.read_timeout.count()) + " ms"));
        }
        if ((fds[1].revents & POLLIN) != 0) {
            return tl::unexpected(TransportError::closed());
        }

        const ssize_t n = ::read(out_fd, read_buffer_, kReadBufferSize);
        if (n > 0) {
            read_buffer_pos_ = 0;
            read_buffer_len_ = static_cast<std::size_t>(n);
            return read_buffer_len_;
        }
        if ((n == -1) && (errno == EINTR)) {
            continue;
        }
        if (n == -1) {
            return tl::unexpected(TransportError::network("read failed: " + errno_text(errno)));
        }

        // EOF: the peer closed its output, for a child almost always because it exited.
        std::lock_guard lock(mutex_);
        reap_if_exited();
        return tl::unexpected(TransportError::closed(exit_description()));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Process state
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> PipeTransport::probe(std::chrono::milliseconds /*deadline*/) {
    // Both checks answer immediately, so the deadline never comes into play.
    std::lock_guard lock(mutex_);
    if (open_ == false) {
        return tl::unexpected(TransportError::closed());
    }
    if (config_.mode == PipeMode::Attach) {
        // A write end whose reader has gone reports POLLERR.
        pollfd fds[1]{};
        fds[0].fd = write_fd_;
        const int ready = ::poll(fds, 1, 0);
        if ((ready > 0) && ((fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) != 0)) {
            return tl::unexpected(TransportError::closed("peer closed its input"));
        }
        return {};
    }
    reap_if_exited();
    if (child_pid_ == -1) {
        return tl::unexpected(TransportError::closed(exit_description()));
    }
    return {};
}

void PipeTransport::reap_if_exited() {
    if (child_pid_ <= 0) {
        return;
    }
    int status = 0;
    const pid_t result = ::waitpid(child_pid_, &status, WNOHANG);
    if (result == child_pid_) {
        exit_code_ = decode_wait_status(status);
        get_logger().warn_fmt(kLog, "pid {} exited ({})", child_pid_, exit_description());
        child_pid_ = -1;
    }
}

std::string PipeTransport::exit_description() const {
    if (config_.mode == PipeMode::Attach) {
        return "peer closed its output";
    }
    if (exit_code_.has_value() == false) {
        return "subordinate process closed its output";
    }
    if (*exit_code_ < 0) {
        return "subordinate process killed by signal " + std::to_string(-*exit_code_);
    }
    return "subordinate process exited with code " + std::to_string(*exit_code_);
}

bool PipeTransport::is_open() const noexcept {
    std::lock_guard lock(mutex_);
    return open_;
}

bool PipeTransport::is_process_alive() const {
    std::lock_guard lock(mutex_);
    if (child_pid_ <= 0) {
        return false;
    }
    // WNOWAIT leaves the zombie for reap_if_exited() to collect.
    siginfo_t info{};
    const int result = ::waitid(P_PID, static_cast<id_t>(child_pid_), &info,
                                WEXITED | WNOHANG | WNOWAIT);
    return (result == 0) && (info.si_pid == 0);
}

std::optional<int> PipeTransport::exit_code() const {
    std::lock_guard lock(mutex_);
    return exit_code_;
}

std::optional<pid_t> PipeTransport::pid() const {
    std::lock_guard lock(mutex_);
    if (child_pid_ <= 0) {
        return std::nullopt;
    }
    return child_pid_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Stderr capture
// ─────────────────────────────────────────────────────────────────────────────

void PipeTransport::stderr_reader_loop(int fd, int wake_fd) {
    char buffer[1024];
    while (true) {
        pollfd fds[2]{};
        fds[0].fd = fd;
        fds[0].events = POLLIN;
        fds[1].fd = wake_fd;
        fds[1].events = POLLIN;

        const int ready = ::poll(fds, 2, -1);
        if ((ready == -1) && (errno == EINTR)) {
            continue;
        }
        if ((ready <= 0) || ((fds[1].revents & POLLIN) != 0)) {
            return;
        }

        const ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if ((n == -1) && (errno == EINTR)) {
            continue;
        }
        if (n <= 0) {
            return;
        }

        const std::string_view chunk(buffer, static_cast<std::size_t>(n));
        {
            std::lock_guard lock(stderr_mutex_);
            stderr_buffer_.append(chunk);
            if (stderr_buffer_.size() > kMaxCapturedStderr) {
                stderr_buffer_.erase(0, stderr_buffer_.size() - kMaxCapturedStderr);
            }
        }
        if (config_.stderr_callback) {
            config_.stderr_callback(chunk);
        }
    }
}

std::string PipeTransport::read_stderr() {
    std::lock_guard lock(stderr_mutex_);
    std::string out = std::move(stderr_buffer_);
    stderr_buffer_.clear();
    return out;
}

}  // namespace mcpwire
