#include <lazybar/sources/command-source.h>
#include <lazybar/sources/markup.h>
#include <ytrace/ytrace.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lazybar {

namespace {

constexpr size_t kMaxOutput = 1 << 20;

// Shared between the reading thread and a cancel callback on another thread.
// The child is only reaped under the lock, so kill() never hits a reused pid.
struct ChildState {
    std::mutex mutex;
    pid_t pid = -1;
    bool reaped = false;
    bool killed = false;
};

} // namespace

CommandSource::CommandSource(const Options& options) noexcept : _options(options) {
    for (const auto& [button, command] : _options.onClick) {
        _bindings.bind(button, Action{ACTION_EXEC, command});
    }
}

Result<CommandSource::Ptr> CommandSource::create(const Options& options) noexcept {
    if (options.command.empty()) {
        return Err<Ptr>("CommandSource: empty command");
    }
    if (options.interval < 0) {
        return Err<Ptr>("CommandSource: negative interval");
    }
    return Ok(Ptr(new CommandSource(options)));
}

std::string CommandSource::firstLine(const std::string& output) {
    auto end = output.find('\n');
    std::string line = output.substr(0, end);
    const char* ws = " \t\r\n\v\f";
    auto first = line.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = line.find_last_not_of(ws);
    return line.substr(first, last - first + 1);
}

//-----------------------------------------------------------------------------
// Child process
//-----------------------------------------------------------------------------

Result<std::string> CommandSource::run(const std::string& command, SourceContext& ctx) {
    if (ctx.cancelled()) {
        return Err<std::string>("cancelled");
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return Err<std::string>(std::string("pipe failed: ") + strerror(errno));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        return Err<std::string>(std::string("fork failed: ") + strerror(err));
    }

    if (pid == 0) {
        // Child: own process group so cancellation reaches grandchildren
        setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(fds[1], STDOUT_FILENO);
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);  // Only reached if exec fails
    }

    close(fds[1]);
    // Also set from the parent so a kill right after fork reaches the group
    setpgid(pid, pid);

    auto child = std::make_shared<ChildState>();
    child->pid = pid;
    auto cancelId = ctx.onCancel([child] {
        std::lock_guard<std::mutex> lock(child->mutex);
        if (!child->reaped) {
            if (kill(-child->pid, SIGKILL) != 0) {
                kill(child->pid, SIGKILL);
            }
            child->killed = true;
        }
    });

    std::string output;
    char buf[4096];
    for (;;) {
        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            if (output.size() < kMaxOutput) {
                output.append(buf, size_t(n));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;  // EOF or error: the child closed stdout or died
    }
    close(fds[0]);

    // Wait without reaping so the pid stays valid for the cancel callback
    siginfo_t info{};
    while (waitid(P_PID, id_t(pid), &info, WEXITED | WNOWAIT) != 0 && errno == EINTR) {
    }

    int status = 0;
    bool killed = false;
    {
        std::lock_guard<std::mutex> lock(child->mutex);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        child->reaped = true;
        killed = child->killed;
    }
    ctx.removeOnCancel(cancelId);

    if (killed) {
        return Err<std::string>("cancelled");
    }
    if (WIFSIGNALED(status)) {
        return Err<std::string>("'" + command + "' killed by signal " + std::to_string(WTERMSIG(status)));
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return Err<std::string>("'" + command + "' exited with status " + std::to_string(WEXITSTATUS(status)));
    }
    return Ok(output);
}

//-----------------------------------------------------------------------------
// Stream
//-----------------------------------------------------------------------------

Result<std::optional<ContentItem>> CommandSource::refresh(SourceContext& ctx) {
    _nextRun = std::chrono::steady_clock::now() + std::chrono::seconds(_options.interval);

    auto output = run(_options.command, ctx);
    if (!output) {
        return Err<std::optional<ContentItem>>("command", output);
    }
    return Ok(std::optional<ContentItem>(parseMarkup(firstLine(*output))));
}

Result<std::optional<ContentItem>> CommandSource::next(SourceContext& ctx) {
    if (!_started) {
        _started = true;
        return refresh(ctx);
    }

    for (;;) {
        SourceContext::WaitResult res;
        if (_options.interval > 0) {
            res = ctx.waitUntil(_nextRun);
        } else {
            // Run-once: nothing to do until a click or shutdown
            res = ctx.waitFor(std::chrono::hours(24));
        }

        if (res == SourceContext::WaitResult::Cancelled) {
            return Ok(std::optional<ContentItem>());
        }

        if (auto action = ctx.takeAction()) {
            if (action->name == ACTION_EXEC) {
                ydebug("CommandSource: click runs '{}'", action->payload);
                if (auto clicked = run(action->payload, ctx); !clicked) {
                    ywarn("CommandSource: click command failed: {}", error_msg(clicked));
                }
            }
            if (ctx.cancelled()) {
                return Ok(std::optional<ContentItem>());
            }
            return refresh(ctx);
        }

        if (res == SourceContext::WaitResult::Timeout && _options.interval > 0) {
            return refresh(ctx);
        }
    }
}

} // namespace lazybar
