#include "toolbridge/worker_supervisor.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/frame_reader.hpp"
#include "toolbridge/log.hpp"
#include <cerrno>
#include <csignal>
#include <condition_variable>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace toolbridge {

const char* to_string(WorkerState s) {
    switch (s) {
        case WorkerState::Unstarted: return "unstarted";
        case WorkerState::Starting:  return "starting";
        case WorkerState::Ready:     return "ready";
        case WorkerState::Exited:    return "exited";
        case WorkerState::Crashed:   return "crashed";
    }
    return "unknown";
}

namespace {

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// How long a dying worker gets to finish: to exit after closing stdout, or
// for its last replies to be read after it exited.
constexpr std::chrono::milliseconds kExitGrace{200};

std::string describe_status(int status) {
    if (WIFEXITED(status)) return "exit code " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return "signal " + std::to_string(WTERMSIG(status));
    return "status " + std::to_string(status);
}

} // namespace

// ---- WorkerProcess ----

/// One spawned worker. Two threads watch it: the reader drains stdout, and
/// the exit watcher is the only caller of waitpid(). Either one reports the
/// worker gone; stdout EOF alone is not enough, since a grandchild can keep
/// the pipe open after the worker itself has exited.
struct WorkerProcess {
    uint64_t generation{0};
    pid_t pid{-1};
    int stdin_fd{-1};
    int stdout_fd{-1};
    std::unique_ptr<FrameReader> reader;
    std::thread reader_thread;
    std::thread exit_watcher;

    std::mutex mutex;                 // exited, status, reader_done
    std::condition_variable cv;
    bool exited{false};
    int status{0};
    bool reader_done{false};

    /// Exit watcher body. waitid(WNOWAIT) leaves a zombie, so the pid cannot
    /// be recycled while reap() may still signal it.
    void watch_exit() {
        siginfo_t info{};
        while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) < 0) {
            if (errno != EINTR) break;
        }
        std::lock_guard<std::mutex> lock(mutex);
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        exited = true;
        cv.notify_all();
    }

    /// SIGTERM unless already reaped; the zombie guarantees the pid is still ours.
    void terminate() {
        std::lock_guard<std::mutex> lock(mutex);
        if (!exited) ::kill(pid, SIGTERM);
    }

    /// Blocks until the child is gone, escalating to SIGKILL after `grace`.
    std::string reap(std::chrono::milliseconds grace) {
        std::unique_lock<std::mutex> lock(mutex);
        if (!cv.wait_for(lock, grace, [this] { return exited; })) {
            ::kill(pid, SIGKILL);
            cv.wait(lock, [this] { return exited; });
        }
        return describe_status(status);
    }

    /// True once the reader has seen the end of stdout, or after `grace`.
    bool wait_reader_done(std::chrono::milliseconds grace) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, grace, [this] { return reader_done; });
    }

    void mark_reader_done() {
        std::lock_guard<std::mutex> lock(mutex);
        reader_done = true;
        cv.notify_all();
    }

    /// Stop and join both threads. The child must already be reaped or
    /// killed. Never called with the supervisor's locks held: the reader may
    /// be waiting on them.
    void stop_threads() {
        if (reader) reader->interrupt();
        if (reader_thread.joinable()) reader_thread.join();
        if (exit_watcher.joinable()) exit_watcher.join();
    }

    /// Release the pipes. Callers hold the write lock so no writer still
    /// uses stdin_fd.
    void close_pipes() {
        reader.reset();
        close_fd(stdin_fd);
        close_fd(stdout_fd);
    }
};

// ---- Impl ----

struct WorkerSupervisor::Impl {
    Options opts;
    MessageHandler message_handler;
    CrashHandler crash_handler;

    mutable std::mutex mutex_;        // state_, current_, retired_
    std::mutex write_mutex_;          // stdin writes, spawns and closing pipes; taken before mutex_
    WorkerState state_{WorkerState::Unstarted};
    std::unique_ptr<WorkerProcess> current_;
    std::vector<std::unique_ptr<WorkerProcess>> retired_;
    uint64_t generation_{0};
    uint64_t restart_count_{0};

    explicit Impl(Options o) : opts(std::move(o)) {}

    std::unique_ptr<WorkerProcess> spawn();
    void reader_loop(WorkerProcess* proc, MessageHandler handler);
    void watch_loop(WorkerProcess* proc);
    std::vector<std::unique_ptr<WorkerProcess>> take_retired();
    void release(std::vector<std::unique_ptr<WorkerProcess>>& procs);
    void handle_exit(WorkerProcess* proc, const std::string& reason);
};

std::unique_ptr<WorkerProcess> WorkerSupervisor::Impl::spawn() {
    if (opts.command.empty()) {
        throw WorkerStartupError("No worker command configured");
    }

    int in_pipe[2], out_pipe[2], status_pipe[2];
    if (::pipe2(in_pipe, O_CLOEXEC) < 0) {
        throw WorkerStartupError(std::string("Failed to create worker pipes: ") + std::strerror(errno));
    }
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        throw WorkerStartupError(std::string("Failed to create worker pipes: ") + std::strerror(err));
    }
    if (::pipe2(status_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        throw WorkerStartupError(std::string("Failed to create worker pipes: ") + std::strerror(err));
    }

    // Everything the child touches is prepared before fork().
    std::vector<char*> argv_vec;
    argv_vec.push_back(const_cast<char*>(opts.command.c_str()));
    for (const auto& arg : opts.args) {
        argv_vec.push_back(const_cast<char*>(arg.c_str()));
    }
    argv_vec.push_back(nullptr);
    const char* cwd = opts.working_directory ? opts.working_directory->c_str() : nullptr;

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], status_pipe[0], status_pipe[1]}) {
            ::close(fd);
        }
        throw WorkerStartupError(std::string("Failed to fork worker: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: undo the parent's signal setup, wire up stdio, exec.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);

        int err = 0;
        if (cwd && ::chdir(cwd) < 0) {
            err = errno;
        } else {
            ::execvp(argv_vec[0], argv_vec.data());
            err = errno;
        }
        ssize_t n = ::write(status_pipe[1], &err, sizeof(err));
        (void)n;
        ::_exit(127);
    }

    // Parent
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(status_pipe[1]);

    // The status pipe closes on a successful exec; otherwise the child
    // reports errno before exiting.
    int child_err = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_err, sizeof(child_err));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_err))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        throw WorkerStartupError("Failed to start worker '" + opts.command + "': " +
                                 std::strerror(child_err));
    }

    auto proc = std::make_unique<WorkerProcess>();
    proc->pid = pid;
    proc->stdin_fd = in_pipe[1];
    proc->stdout_fd = out_pipe[0];
    proc->reader = std::make_unique<FrameReader>(proc->stdout_fd);
    return proc;
}

std::vector<std::unique_ptr<WorkerProcess>> WorkerSupervisor::Impl::take_retired() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::unique_ptr<WorkerProcess>> out;
    out.swap(retired_);
    return out;
}

void WorkerSupervisor::Impl::release(std::vector<std::unique_ptr<WorkerProcess>>& procs) {
    if (procs.empty()) return;
    for (auto& p : procs) p->stop_threads();
    std::lock_guard<std::mutex> wlock(write_mutex_);
    for (auto& p : procs) p->close_pipes();
    procs.clear();
}

void WorkerSupervisor::Impl::reader_loop(WorkerProcess* proc, MessageHandler handler) {
    while (auto event = proc->reader->next()) {
        if (auto* msg = std::get_if<JsonRpcMessage>(&*event)) {
            if (!handler) continue;
            try {
                handler(std::move(*msg));
            } catch (const std::exception& e) {
                LOG4CPLUS_ERROR(logging::worker(), "Worker message handler threw: " << e.what());
            }
        } else {
            const auto& bad = std::get<DecodeError>(*event);
            LOG4CPLUS_WARN(logging::codec(),
                "Discarding undecodable line from worker pid " << proc->pid << ": " << bad.reason);
        }
    }
    proc->mark_reader_done();

    if (!proc->reader->at_eof()) return; // interrupted: shutdown or exit watcher
    std::string reason = proc->reader->last_errno() != 0
        ? std::string("read error: ") + std::strerror(proc->reader->last_errno())
        : std::string("worker closed its stdout");
    handle_exit(proc, reason);
}

void WorkerSupervisor::Impl::watch_loop(WorkerProcess* proc) {
    proc->watch_exit();
    // Replies written just before exiting are still in the pipe; let the
    // reader deliver them before pending calls are failed.
    if (!proc->wait_reader_done(kExitGrace)) {
        LOG4CPLUS_DEBUG(logging::worker(), "Worker pid " << proc->pid
                        << " exited with its stdout still open");
    }
    handle_exit(proc, "worker process exited");
}

void WorkerSupervisor::Impl::handle_exit(WorkerProcess* proc, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Shut down, already reported by the other watcher, or a newer worker
    // already owns the slot.
    if (!current_ || current_->generation != proc->generation) return;

    state_ = WorkerState::Crashed;
    std::string status = proc->reap(kExitGrace);
    std::string detail = reason + " (" + status + ")";
    LOG4CPLUS_ERROR(logging::worker(), "Worker pid " << proc->pid << " went away: " << detail);

    // Pending calls are drained before anyone can observe the Crashed state
    // and respawn.
    if (crash_handler) {
        try {
            crash_handler(detail);
        } catch (const std::exception& e) {
            LOG4CPLUS_ERROR(logging::worker(), "Crash handler threw: " << e.what());
        }
    }
    // Whatever a lingering grandchild writes is no longer ours.
    proc->reader->interrupt();
    retired_.push_back(std::move(current_));
}

// ---- WorkerSupervisor ----

WorkerSupervisor::WorkerSupervisor(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    ignore_sigpipe_once();
}

WorkerSupervisor::~WorkerSupervisor() {
    shutdown();
}

void WorkerSupervisor::on_message(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    impl_->message_handler = std::move(handler);
}

void WorkerSupervisor::on_crash(CrashHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    impl_->crash_handler = std::move(handler);
}

void WorkerSupervisor::ensure_running() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        if (impl_->state_ == WorkerState::Ready) return;
        if (impl_->state_ == WorkerState::Exited) {
            throw WorkerUnavailableError("Worker supervisor has been shut down");
        }
    }

    // A crashed worker's reader may still be refusing a request through
    // send_line(); join it before taking the write lock.
    auto retired = impl_->take_retired();
    impl_->release(retired);

    // write_mutex_ serializes spawns; a second caller waits here and then
    // finds the worker Ready.
    std::lock_guard<std::mutex> spawn_lock(impl_->write_mutex_);
    WorkerState previous;
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        if (impl_->state_ == WorkerState::Ready) return;
        if (impl_->state_ == WorkerState::Exited) {
            throw WorkerUnavailableError("Worker supervisor has been shut down");
        }
        previous = impl_->state_;
        impl_->state_ = WorkerState::Starting;
        handler = impl_->message_handler;
    }

    if (previous == WorkerState::Crashed) {
        LOG4CPLUS_INFO(logging::worker(), "Respawning worker: " << impl_->opts.command);
    } else {
        LOG4CPLUS_INFO(logging::worker(), "Starting worker: " << impl_->opts.command);
    }

    std::unique_ptr<WorkerProcess> proc;
    try {
        proc = impl_->spawn();
    } catch (const WorkerStartupError& e) {
        LOG4CPLUS_ERROR(logging::worker(), e.what());
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        if (impl_->state_ == WorkerState::Starting) impl_->state_ = previous;
        throw;
    }

    std::unique_lock<std::mutex> lock(impl_->mutex_);
    if (impl_->state_ == WorkerState::Exited) {
        // shutdown() raced with the spawn. No threads were started yet.
        lock.unlock();
        ::kill(proc->pid, SIGKILL);
        int status = 0;
        while (::waitpid(proc->pid, &status, 0) < 0 && errno == EINTR) {}
        proc->close_pipes();
        throw WorkerUnavailableError("Worker supervisor has been shut down");
    }

    // Both watchers start under mutex_, so neither can report the exit
    // before the process is registered as current.
    WorkerProcess* raw = proc.get();
    impl_->current_ = std::move(proc);
    raw->generation = ++impl_->generation_;
    impl_->state_ = WorkerState::Ready;
    if (previous == WorkerState::Crashed) ++impl_->restart_count_;
    raw->reader_thread = std::thread([impl = impl_.get(), raw, handler = std::move(handler)] {
        impl->reader_loop(raw, handler);
    });
    raw->exit_watcher = std::thread([impl = impl_.get(), raw] { impl->watch_loop(raw); });
    LOG4CPLUS_INFO(logging::worker(), "Worker ready, pid " << raw->pid
                   << " (generation " << raw->generation << ")");
}

void WorkerSupervisor::send_line(const std::string& line) {
    {
        // Fail fast, without queueing behind the write lock: shutdown()
        // may be joining the very thread that called us.
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        if (impl_->state_ != WorkerState::Ready || !impl_->current_) {
            throw WorkerUnavailableError(std::string("Worker is not running (") +
                                         to_string(impl_->state_) + ")");
        }
    }

    std::lock_guard<std::mutex> wlock(impl_->write_mutex_);
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        if (impl_->state_ != WorkerState::Ready || !impl_->current_) {
            throw WorkerUnavailableError(std::string("Worker is not running (") +
                                         to_string(impl_->state_) + ")");
        }
        fd = impl_->current_->stdin_fd;
    }

    const char* data = line.data();
    size_t remaining = line.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw WorkerUnavailableError(std::string("Failed to write to worker: ") +
                                         std::strerror(errno));
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
}

void WorkerSupervisor::shutdown() {
    std::vector<std::unique_ptr<WorkerProcess>> procs;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex_);
        if (impl_->state_ == WorkerState::Exited) return;
        impl_->state_ = WorkerState::Exited;
        procs.swap(impl_->retired_);
        if (impl_->current_) procs.push_back(std::move(impl_->current_));
    }

    for (auto& proc : procs) {
        LOG4CPLUS_INFO(logging::worker(), "Stopping worker pid " << proc->pid);
        proc->terminate();
        std::string status = proc->reap(impl_->opts.terminate_grace);
        LOG4CPLUS_DEBUG(logging::worker(), "Worker pid " << proc->pid << " stopped: " << status);
    }

    // The child's death released any writer blocked on a full pipe.
    impl_->release(procs);
}

WorkerState WorkerSupervisor::state() const {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    return impl_->state_;
}

std::optional<pid_t> WorkerSupervisor::pid() const {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    if (!impl_->current_) return std::nullopt;
    return impl_->current_->pid;
}

uint64_t WorkerSupervisor::restart_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex_);
    return impl_->restart_count_;
}

} // namespace toolbridge
