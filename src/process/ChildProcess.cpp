// SPDX-License-Identifier: Apache-2.0
#include "ChildProcess.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <format>
#include <mutex>
#include <thread>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#else
    #include <sys/wait.h>

    #include <fcntl.h>
    #include <poll.h>
    #include <signal.h>
    #include <spawn.h>
    #include <unistd.h>

extern char** environ;
#endif

namespace mcprt
{

namespace
{

    constexpr auto ReaderPollInterval = std::chrono::milliseconds(200);
    constexpr auto ReaderDrainTimeout = std::chrono::milliseconds(1000);

    enum class Stream
    {
        Stdout,
        Stderr,
    };

    constexpr auto streamName(Stream stream) -> std::string_view
    {
        return stream == Stream::Stdout ? "stdout" : "stderr";
    }

    auto commandLine(const ChildProcessConfig& config) -> std::string
    {
        auto line = config.command;
        for (const auto& arg: config.args)
        {
            line += ' ';
            if (arg.empty() || arg.find_first_of(" \t\"") != std::string::npos)
                line += std::format("\"{}\"", arg);
            else
                line += arg;
        }
        return line;
    }

#ifndef _WIN32
    auto makePipe(std::array<int, 2>& fds) -> bool
    {
    #ifdef __linux__
        return ::pipe2(fds.data(), O_CLOEXEC) == 0;
    #else
        if (::pipe(fds.data()) != 0)
            return false;
        ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        return true;
    #endif
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto decodeWaitStatus(int status) -> int
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return -WTERMSIG(status);
        return -1;
    }
#else
    void closeHandle(HANDLE& handle)
    {
        if (handle != INVALID_HANDLE_VALUE && handle != nullptr)
        {
            CloseHandle(handle);
            handle = INVALID_HANDLE_VALUE;
        }
    }
#endif

} // namespace

auto resolveExecutable(std::string_view command) -> std::optional<std::filesystem::path>
{
    if (command.empty())
        return std::nullopt;

    auto const isExecutable = [](const std::filesystem::path& candidate) -> bool {
        auto ec = std::error_code {};
        if (!std::filesystem::is_regular_file(candidate, ec))
            return false;
#ifdef _WIN32
        return true;
#else
        return ::access(candidate.c_str(), X_OK) == 0;
#endif
    };

#ifdef _WIN32
    auto extensions = std::vector<std::string> { "" };
    if (auto const* const pathExt = std::getenv("PATHEXT"))
    {
        auto exts = std::string_view { pathExt };
        while (!exts.empty())
        {
            auto const sep = exts.find(';');
            auto const ext = exts.substr(0, sep);
            if (!ext.empty())
                extensions.emplace_back(ext);
            exts = sep == std::string_view::npos ? std::string_view {} : exts.substr(sep + 1);
        }
    }
    constexpr auto PathListSeparator = ';';
#else
    auto const extensions = std::vector<std::string> { "" };
    constexpr auto PathListSeparator = ':';
#endif

    auto const tryCandidate = [&](const std::filesystem::path& base) -> std::optional<std::filesystem::path> {
        for (const auto& ext: extensions)
        {
            auto candidate = base;
            candidate += ext;
            if (isExecutable(candidate))
                return candidate;
        }
        return std::nullopt;
    };

    if (command.find_first_of("/\\") != std::string_view::npos)
        return tryCandidate(std::filesystem::path(command));

    auto const* const pathEnv = std::getenv("PATH");
    if (!pathEnv)
        return std::nullopt;

    auto dirs = std::string_view { pathEnv };
    while (!dirs.empty())
    {
        auto const sep = dirs.find(PathListSeparator);
        auto const dir = dirs.substr(0, sep);
        if (!dir.empty())
        {
            if (auto found = tryCandidate(std::filesystem::path(dir) / command))
                return found;
        }
        dirs = sep == std::string_view::npos ? std::string_view {} : dirs.substr(sep + 1);
    }
    return std::nullopt;
}

auto mergedEnvironment(const std::map<std::string, std::string>& overrides) -> std::map<std::string, std::string>
{
    auto env = std::map<std::string, std::string> {};

    auto const addEntry = [&env](std::string_view entry) {
        auto const eq = entry.find('=', 1); // Windows has entries like "=C:=C:\"
        if (eq != std::string_view::npos)
            env.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
    };

#ifdef _WIN32
    if (auto* block = GetEnvironmentStringsA())
    {
        for (auto const* p = block; *p; p += std::strlen(p) + 1)
            addEntry(p);
        FreeEnvironmentStringsA(block);
    }
#else
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
            addEntry(*e);
    }
#endif

    for (const auto& [key, value]: overrides)
        env[key] = value;
    return env;
}

struct ChildProcess::Impl
{
    ChildProcessConfig config;

#ifdef _WIN32
    HANDLE process = INVALID_HANDLE_VALUE;
    DWORD processId = 0;
    HANDLE stdinWrite = INVALID_HANDLE_VALUE;
    HANDLE stdoutRead = INVALID_HANDLE_VALUE;
    HANDLE stderrRead = INVALID_HANDLE_VALUE;
#else
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
#endif

    bool started = false;

    // Guards reaping and the cached exit code.
    std::mutex stateMutex;
    std::optional<int> exitCode;

    // Guards reader bookkeeping and captured stderr.
    mutable std::mutex outputMutex;
    std::condition_variable readersDone;
    int activeReaders = 0;
    std::deque<std::string> stderrLines;

    std::jthread stdoutReader;
    std::jthread stderrReader;

    void emitLine(Stream stream, std::string_view line)
    {
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        log::debug("MCP server '{}' {}: {}", config.name, streamName(stream), line);

        if (stream == Stream::Stderr && config.stderrHistory > 0)
        {
            auto lock = std::lock_guard(outputMutex);
            stderrLines.emplace_back(line);
            while (stderrLines.size() > config.stderrHistory)
                stderrLines.pop_front();
        }
    }

    void consume(Stream stream, std::string& pending)
    {
        auto pos = std::string::size_type { 0 };
        while (true)
        {
            auto const newline = pending.find('\n', pos);
            if (newline == std::string::npos)
                break;
            emitLine(stream, std::string_view(pending).substr(pos, newline - pos));
            pos = newline + 1;
        }
        pending.erase(0, pos);
    }

    void finishReader()
    {
        auto lock = std::lock_guard(outputMutex);
        --activeReaders;
        readersDone.notify_all();
    }

    /// @brief Reader thread body: drains one output stream line by line until end of stream.
    void readLoop(Stream stream, const std::stop_token& stopToken)
    {
        auto pending = std::string {};
        auto buf = std::array<char, 4096> {};

#ifdef _WIN32
        auto const handle = stream == Stream::Stdout ? stdoutRead : stderrRead;
        while (!stopToken.stop_requested())
        {
            DWORD bytesRead = 0;
            if (!ReadFile(handle, buf.data(), static_cast<DWORD>(buf.size()), &bytesRead, nullptr)
                || bytesRead == 0)
                break;
            pending.append(buf.data(), bytesRead);
            consume(stream, pending);
        }
#else
        auto const fd = stream == Stream::Stdout ? stdoutRead : stderrRead;
        while (true)
        {
            auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
            auto const ready = ::poll(&pfd, 1, static_cast<int>(ReaderPollInterval.count()));
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                log::warning("Polling {} of '{}' failed: {}", streamName(stream), config.name, std::strerror(errno));
                break;
            }
            if (ready == 0)
            {
                // Only reached when the child's output outlives the child itself.
                if (stopToken.stop_requested())
                    break;
                continue;
            }

            auto const bytesRead = ::read(fd, buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
                break;
            pending.append(buf.data(), static_cast<size_t>(bytesRead));
            consume(stream, pending);
        }
#endif

        if (!pending.empty())
            emitLine(stream, pending);

        log::trace("MCP server '{}' {} reader finished", config.name, streamName(stream));
        finishReader();
    }

    void startReaders()
    {
        {
            auto lock = std::lock_guard(outputMutex);
            activeReaders = 2;
        }
        stdoutReader = std::jthread([this](const std::stop_token& token) { readLoop(Stream::Stdout, token); });
        stderrReader = std::jthread([this](const std::stop_token& token) { readLoop(Stream::Stderr, token); });
    }

    void stopReaders()
    {
        stdoutReader.request_stop();
        stderrReader.request_stop();
#ifdef _WIN32
        if (stdoutReader.joinable())
            CancelSynchronousIo(stdoutReader.native_handle());
        if (stderrReader.joinable())
            CancelSynchronousIo(stderrReader.native_handle());
#endif
        if (stdoutReader.joinable())
            stdoutReader.join();
        if (stderrReader.joinable())
            stderrReader.join();
    }

    void closeHandles()
    {
#ifdef _WIN32
        closeHandle(stdinWrite);
        closeHandle(stdoutRead);
        closeHandle(stderrRead);
        closeHandle(process);
#else
        closeFd(stdinWrite);
        closeFd(stdoutRead);
        closeFd(stderrRead);
#endif
    }
};

ChildProcess::ChildProcess(): _impl(std::make_unique<Impl>())
{
}

ChildProcess::~ChildProcess()
{
    if (!_impl->started)
        return;

    if (isRunning())
    {
        log::warning("Killing still running process '{}' (PID: {})", _impl->config.name, pid());
        if (auto killed = kill(); !killed)
            log::error("{}", killed.error().message);
        wait();
    }

    if (!waitForReaders(ReaderDrainTimeout))
        log::debug("Output of '{}' is still open after exit, cancelling readers", _impl->config.name);

    _impl->stopReaders();
    _impl->closeHandles();
}

auto ChildProcess::start(const ChildProcessConfig& config) -> VoidResult
{
    if (_impl->started)
        return makeError(ErrorCode::LaunchError, "Process already started");
    if (config.command.empty())
        return makeError(ErrorCode::InvalidArgument, "Invalid server configuration: command is missing");

    _impl->config = config;
    auto const env = mergedEnvironment(config.env);

#ifdef _WIN32
    // Run through cmd.exe so that .cmd/.bat shims (npx, uvx, ...) resolve like in a shell.
    SECURITY_ATTRIBUTES sa {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE stdinRead = INVALID_HANDLE_VALUE, stdinWrite = INVALID_HANDLE_VALUE;
    HANDLE stdoutRead = INVALID_HANDLE_VALUE, stdoutWrite = INVALID_HANDLE_VALUE;
    HANDLE stderrRead = INVALID_HANDLE_VALUE, stderrWrite = INVALID_HANDLE_VALUE;
    auto const closeAll = [&] {
        closeHandle(stdinRead);
        closeHandle(stdinWrite);
        closeHandle(stdoutRead);
        closeHandle(stdoutWrite);
        closeHandle(stderrRead);
        closeHandle(stderrWrite);
    };

    if (!CreatePipe(&stdinRead, &stdinWrite, &sa, 0) || !CreatePipe(&stdoutRead, &stdoutWrite, &sa, 0)
        || !CreatePipe(&stderrRead, &stderrWrite, &sa, 0))
    {
        closeAll();
        return makeError(ErrorCode::LaunchError, "Failed to create pipes");
    }

    SetHandleInformation(stdinWrite, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stdoutRead, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stderrRead, HANDLE_FLAG_INHERIT, 0);

    auto cmdLine = std::format("cmd.exe /d /s /c \"{}\"", commandLine(config));

    auto envBlock = std::string {};
    for (const auto& [key, value]: env)
    {
        envBlock += std::format("{}={}", key, value);
        envBlock.push_back('\0');
    }
    envBlock.push_back('\0');

    STARTUPINFOA si {};
    si.cb = sizeof(si);
    si.hStdInput = stdinRead;
    si.hStdOutput = stdoutWrite;
    si.hStdError = stderrWrite;
    si.dwFlags |= STARTF_USESTDHANDLES | STARTF_USESHOWWINDOW;
    si.wShowWindow = SW_HIDE;

    PROCESS_INFORMATION pi {};
    if (!CreateProcessA(nullptr,
                        cmdLine.data(),
                        nullptr,
                        nullptr,
                        TRUE,
                        CREATE_NO_WINDOW | CREATE_NEW_PROCESS_GROUP,
                        envBlock.data(),
                        nullptr,
                        &si,
                        &pi))
    {
        auto const lastError = GetLastError();
        closeAll();
        return makeError(ErrorCode::LaunchError,
                         std::format("Failed to start process '{}' (error {})", config.command, lastError));
    }

    closeHandle(stdinRead);
    closeHandle(stdoutWrite);
    closeHandle(stderrWrite);
    CloseHandle(pi.hThread);

    _impl->process = pi.hProcess;
    _impl->processId = pi.dwProcessId;
    _impl->stdinWrite = stdinWrite;
    _impl->stdoutRead = stdoutRead;
    _impl->stderrRead = stderrRead;
#else
    auto stdinPipe = std::array<int, 2> { -1, -1 };
    auto stdoutPipe = std::array<int, 2> { -1, -1 };
    auto stderrPipe = std::array<int, 2> { -1, -1 };
    auto const closeAll = [&] {
        for (auto* fds: { &stdinPipe, &stdoutPipe, &stderrPipe })
        {
            closeFd((*fds)[0]);
            closeFd((*fds)[1]);
        }
    };

    if (!makePipe(stdinPipe) || !makePipe(stdoutPipe) || !makePipe(stderrPipe))
    {
        auto const savedErrno = errno;
        closeAll();
        return makeError(ErrorCode::LaunchError, std::format("Failed to create pipes: {}", std::strerror(savedErrno)));
    }

    // All pipe ends are close-on-exec; dup2 clears the flag on the child's standard descriptors.
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    // Own process group, so termination reaches helpers spawned by launchers such as npx.
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t defaultSignals;
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    sigset_t emptyMask;
    sigemptyset(&emptyMask);
    posix_spawnattr_setsigdefault(&attr, &defaultSignals);
    posix_spawnattr_setsigmask(&attr, &emptyMask);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setflags(&attr,
                             static_cast<short>(POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF
                                                | POSIX_SPAWN_SETSIGMASK));

    // Build argv
    auto argCopies = std::vector<std::string> {};
    argCopies.reserve(config.args.size() + 1);
    argCopies.push_back(config.command);
    argCopies.insert(argCopies.end(), config.args.begin(), config.args.end());
    auto argv = std::vector<char*> {};
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment
    auto envStrings = std::vector<std::string> {};
    envStrings.reserve(env.size());
    for (const auto& [key, value]: env)
        envStrings.push_back(std::format("{}={}", key, value));
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, &attr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    if (status != 0)
    {
        closeAll();
        return makeError(ErrorCode::LaunchError,
                         std::format("Failed to spawn process '{}': {}", config.command, std::strerror(status)));
    }

    _impl->childPid = pid;
    _impl->stdinWrite = std::exchange(stdinPipe[1], -1);
    _impl->stdoutRead = std::exchange(stdoutPipe[0], -1);
    _impl->stderrRead = std::exchange(stderrPipe[0], -1);
#endif

    _impl->started = true;
    _impl->startReaders();

    log::info("Started process '{}' (PID: {}): {}", config.name, pid(), commandLine(config));
    return {};
}

auto ChildProcess::pid() const -> int
{
#ifdef _WIN32
    return _impl->started ? static_cast<int>(_impl->processId) : -1;
#else
    return static_cast<int>(_impl->childPid);
#endif
}

auto ChildProcess::isRunning() -> bool
{
    auto lock = std::lock_guard(_impl->stateMutex);
    if (!_impl->started || _impl->exitCode)
        return false;

#ifdef _WIN32
    if (WaitForSingleObject(_impl->process, 0) == WAIT_TIMEOUT)
        return true;
    DWORD code = 0;
    GetExitCodeProcess(_impl->process, &code);
    _impl->exitCode = static_cast<int>(code);
    return false;
#else
    auto status = 0;
    auto const result = ::waitpid(_impl->childPid, &status, WNOHANG);
    if (result == 0)
        return true;
    if (result < 0)
    {
        if (errno == EINTR)
            return true;
        log::debug("waitpid({}) failed: {}", _impl->childPid, std::strerror(errno));
        _impl->exitCode = -1;
        return false;
    }
    _impl->exitCode = decodeWaitStatus(status);
    return false;
#endif
}

auto ChildProcess::exitCode() const -> std::optional<int>
{
    auto lock = std::lock_guard(_impl->stateMutex);
    return _impl->exitCode;
}

auto ChildProcess::terminate() -> VoidResult
{
    if (!isRunning())
        return {};

#ifdef _WIN32
    // No console to deliver a control event to; termination is immediate.
    if (!TerminateProcess(_impl->process, 1))
        return makeError(ErrorCode::StopError, std::format("TerminateProcess failed (error {})", GetLastError()));
#else
    if (::kill(-_impl->childPid, SIGTERM) != 0 && ::kill(_impl->childPid, SIGTERM) != 0 && errno != ESRCH)
        return makeError(ErrorCode::StopError,
                         std::format("Failed to send SIGTERM to {}: {}", _impl->childPid, std::strerror(errno)));
#endif
    return {};
}

auto ChildProcess::kill() -> VoidResult
{
    if (!isRunning())
        return {};

#ifdef _WIN32
    if (!TerminateProcess(_impl->process, 1))
        return makeError(ErrorCode::StopError, std::format("TerminateProcess failed (error {})", GetLastError()));
#else
    if (::kill(-_impl->childPid, SIGKILL) != 0 && ::kill(_impl->childPid, SIGKILL) != 0 && errno != ESRCH)
        return makeError(ErrorCode::StopError,
                         std::format("Failed to send SIGKILL to {}: {}", _impl->childPid, std::strerror(errno)));
#endif
    return {};
}

auto ChildProcess::waitForExit(std::chrono::milliseconds timeout, std::chrono::milliseconds interval) -> bool
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    interval = std::max(interval, std::chrono::milliseconds(1));
    while (isRunning())
    {
        auto const now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return false;
        std::this_thread::sleep_for(
            std::min(interval, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)));
    }
    return true;
}

void ChildProcess::wait()
{
    auto lock = std::lock_guard(_impl->stateMutex);
    if (!_impl->started || _impl->exitCode)
        return;

#ifdef _WIN32
    WaitForSingleObject(_impl->process, INFINITE);
    DWORD code = 0;
    GetExitCodeProcess(_impl->process, &code);
    _impl->exitCode = static_cast<int>(code);
#else
    auto status = 0;
    auto result = pid_t { -1 };
    do
        result = ::waitpid(_impl->childPid, &status, 0);
    while (result < 0 && errno == EINTR);
    _impl->exitCode = result == _impl->childPid ? decodeWaitStatus(status) : -1;
#endif
}

auto ChildProcess::waitForReaders(std::chrono::milliseconds timeout) -> bool
{
    auto lock = std::unique_lock(_impl->outputMutex);
    return _impl->readersDone.wait_for(lock, timeout, [this] { return _impl->activeReaders == 0; });
}

auto ChildProcess::recentStderr() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_impl->outputMutex);
    return { _impl->stderrLines.begin(), _impl->stderrLines.end() };
}

} // namespace mcprt
