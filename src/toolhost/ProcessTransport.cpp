//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Subprocess transport: fork/exec with pipes, newline-delimited JSON-RPC framing
//==========================================================================================================

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <future>
#include <mutex>
#include <random>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/ProcessTransport.hpp"

namespace toolhost {

namespace {

void makePipe(int fds[2], const char* what) {
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), std::string("ProcessTransport: pipe failed for ") + what);
    }
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Moves every complete line out of buf; a trailing partial line stays buffered.
template <typename Fn>
void drainLines(std::string& buf, Fn&& onLine) {
    std::size_t start = 0;
    for (;;) {
        std::size_t nl = buf.find('\n', start);
        if (nl == std::string::npos) {
            break;
        }
        std::string line = buf.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            onLine(line);
        }
        start = nl + 1;
    }
    buf.erase(0, start);
}

} // namespace

class ProcessTransport::Impl {
public:
    resolver::ResolvedCommand command;
    std::atomic<bool> connected{false};
    std::atomic<bool> stopping{false};
    std::string sessionId;
    ITransport::NotificationHandler notificationHandler;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;
    std::thread readerThread;
    std::thread timeoutThread;
    std::mutex requestMutex;
    std::mutex writeMutex;      // protects stdinFd and line writes
    std::mutex lifecycleMutex;  // serializes Start/Close
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> requestDeadlines;
    std::atomic<unsigned int> requestCounter{0u};

    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    int wakePipe[2]{-1, -1};

    std::chrono::milliseconds requestTimeout{60000};
    std::chrono::milliseconds terminateGrace{2000};

    explicit Impl(resolver::ResolvedCommand cmd) : command(std::move(cmd)) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "stdio-" + std::to_string(dis(gen));
        requestTimeout = std::chrono::milliseconds(GetEnvMillisOrDefault("TOOLHOST_REQUEST_TIMEOUT_MS", 60000));
    }

    ~Impl() {
        shutdown();
    }

    /////////////////////////////////////////// Spawn ///////////////////////////////////////////
    void spawn() {
        if (pid > 0) {
            throw std::system_error(std::make_error_code(std::errc::device_or_resource_busy),
                                    "ProcessTransport: process already started");
        }
        // argv/envp are built before fork; the child only calls async-signal-safe functions.
        std::vector<std::string> argvStore;
        argvStore.reserve(command.args.size() + 1);
        argvStore.push_back(command.executable);
        argvStore.insert(argvStore.end(), command.args.begin(), command.args.end());
        std::vector<char*> argv;
        for (auto& a : argvStore) {
            argv.push_back(a.data());
        }
        argv.push_back(nullptr);

        std::vector<std::string> envStore;
        for (const auto& [k, v] : command.environment) {
            envStore.push_back(k + "=" + v);
        }
        std::vector<char*> envp;
        for (auto& e : envStore) {
            envp.push_back(e.data());
        }
        envp.push_back(nullptr);

        int inPipe[2]{-1, -1};
        int outPipe[2]{-1, -1};
        int errPipe[2]{-1, -1};
        int execPipe[2]{-1, -1};
        auto closeAll = [&]() {
            for (int* p : { inPipe, outPipe, errPipe, execPipe }) {
                closeFd(p[0]);
                closeFd(p[1]);
            }
        };
        try {
            makePipe(inPipe, "stdin");
            makePipe(outPipe, "stdout");
            makePipe(errPipe, "stderr");
            makePipe(execPipe, "exec status");
            makePipe(wakePipe, "wakeup");
        } catch (const std::system_error&) {
            closeAll();
            closeFd(wakePipe[0]);
            closeFd(wakePipe[1]);
            throw;
        }

        // Writes to a dead child must surface as EPIPE, not terminate the host.
        ::signal(SIGPIPE, SIG_IGN);

        pid_t child = ::fork();
        if (child < 0) {
            int err = errno;
            closeAll();
            throw std::system_error(err, std::generic_category(), "ProcessTransport: fork failed");
        }
        if (child == 0) {
            ::signal(SIGPIPE, SIG_DFL);
            ::dup2(inPipe[0], STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(errPipe[1], STDERR_FILENO);
            ::execve(argv[0], argv.data(), envp.data());
            int err = errno;
            ssize_t ignored = ::write(execPipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }

        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        closeFd(execPipe[1]);

        // EOF on the CLOEXEC pipe means exec succeeded; an int means it failed with that errno.
        int execErr = 0;
        ssize_t n;
        do {
            n = ::read(execPipe[0], &execErr, sizeof(execErr));
        } while (n < 0 && errno == EINTR);
        closeFd(execPipe[0]);

        if (n == static_cast<ssize_t>(sizeof(execErr))) {
            int status = 0;
            ::waitpid(child, &status, 0);
            closeAll();
            closeFd(wakePipe[0]);
            closeFd(wakePipe[1]);
            LOG_ERROR("ProcessTransport: cannot execute {} (errno={} msg={})", command.executable, execErr, ::strerror(execErr));
            throw std::system_error(execErr, std::generic_category(),
                                    "ProcessTransport: cannot execute " + command.executable);
        }

        pid = child;
        stdinFd = inPipe[1];
        stdoutFd = outPipe[0];
        stderrFd = errPipe[0];
        LOG_INFO("ProcessTransport: started {} (pid={} session={})", command.executable, static_cast<int>(pid), sessionId);
    }

    /////////////////////////////////////////// Writing ///////////////////////////////////////////
    bool writeLine(const std::string& payload) {
        std::lock_guard<std::mutex> lock(writeMutex);
        if (stdinFd < 0) {
            return false;
        }
        std::string line = payload;
        line.push_back('\n');
        std::size_t off = 0;
        while (off < line.size()) {
            ssize_t w = ::write(stdinFd, line.data() + off, line.size() - off);
            if (w < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_WARN("ProcessTransport: write to child failed (errno={} msg={})", errno, ::strerror(errno));
                return false;
            }
            off += static_cast<std::size_t>(w);
        }
        return true;
    }

    void wake() {
        if (wakePipe[1] < 0) {
            return;
        }
        char b = 'x';
        ssize_t w;
        do {
            w = ::write(wakePipe[1], &b, 1);
        } while (w < 0 && errno == EINTR);
        if (w < 0) {
            LOG_WARN("ProcessTransport: wake pipe write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    /////////////////////////////////////////// Reader ///////////////////////////////////////////
    void startReader() {
        readerThread = std::thread([this]() {
            std::string outBuf;
            std::string errBuf;
            bool errOpen = true;
            std::array<char, 4096> tmp{};
            constexpr int waitTimeoutMs = 100;

            for (;;) {
                struct pollfd pfds[3];
                int nfds = 0;
                pfds[nfds++] = { wakePipe[0], POLLIN, 0 };
                pfds[nfds++] = { stdoutFd, POLLIN, 0 };
                const int errIdx = errOpen ? nfds : -1;
                if (errOpen) {
                    pfds[nfds++] = { stderrFd, POLLIN, 0 };
                }
                int rc = ::poll(pfds, static_cast<nfds_t>(nfds), waitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    LOG_ERROR("ProcessTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
                    break;
                }
                if (pfds[0].revents & POLLIN) {
                    break;
                }
                if (rc == 0) {
                    continue;
                }
                if (errIdx >= 0 && (pfds[errIdx].revents & (POLLIN | POLLHUP | POLLERR))) {
                    ssize_t r = ::read(stderrFd, tmp.data(), tmp.size());
                    if (r > 0) {
                        errBuf.append(tmp.data(), static_cast<std::size_t>(r));
                        drainLines(errBuf, [this](const std::string& l) {
                            LOG_DEBUG("ProcessTransport[{}] stderr: {}", sessionId, l);
                        });
                    } else if (r == 0 || errno != EINTR) {
                        errOpen = false;
                    }
                }
                if (pfds[1].revents & (POLLIN | POLLHUP | POLLERR)) {
                    ssize_t r = ::read(stdoutFd, tmp.data(), tmp.size());
                    if (r > 0) {
                        outBuf.append(tmp.data(), static_cast<std::size_t>(r));
                        drainLines(outBuf, [this](const std::string& l) { processMessage(l); });
                    } else if (r == 0 || errno != EINTR) {
                        break;
                    }
                }
            }
            if (!errBuf.empty()) {
                LOG_DEBUG("ProcessTransport[{}] stderr: {}", sessionId, errBuf);
            }
            if (!stopping.load()) {
                LOG_WARN("ProcessTransport: server process {} closed its output", command.executable);
                failPending(JSONRPCErrorCodes::ConnectionClosed, "Connection closed");
                if (errorHandler) {
                    errorHandler("ProcessTransport: server process exited");
                }
            }
        });
    }

    void startTimeouts() {
        timeoutThread = std::thread([this]() {
            using clock = std::chrono::steady_clock;
            while (connected) {
                std::vector<std::string> expired;
                auto now = clock::now();
                {
                    std::lock_guard<std::mutex> lock(requestMutex);
                    for (const auto& kv : requestDeadlines) {
                        if (kv.second <= now) expired.push_back(kv.first);
                    }
                    for (const auto& idStr : expired) {
                        auto it = pendingRequests.find(idStr);
                        if (it != pendingRequests.end()) {
                            auto resp = std::make_unique<JSONRPCResponse>();
                            resp->id = idStr;
                            resp->error = CreateErrorObject(JSONRPCErrorCodes::RequestTimeout, "Request timed out", std::nullopt);
                            it->second.set_value(std::move(resp));
                            pendingRequests.erase(it);
                        }
                        requestDeadlines.erase(idStr);
                    }
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });
    }

    /////////////////////////////////////////// Dispatch ///////////////////////////////////////////
    void processMessage(const std::string& line) {
        LOG_DEBUG("ProcessTransport: received {}", line);
        JSONValue doc;
        try {
            doc = parseJSONValue(line);
        } catch (const std::runtime_error& e) {
            LOG_WARN("ProcessTransport: dropping non-JSON output ({}): {}", e.what(), line);
            return;
        }
        const bool hasMethod = findMember(doc, "method") != nullptr;
        const bool hasId = findMember(doc, "id") != nullptr;
        if (hasMethod && hasId) {
            JSONRPCRequest request;
            if (request.Deserialize(line)) {
                handleRequest(request);
                return;
            }
        } else if (hasMethod) {
            JSONRPCNotification notification;
            if (notification.Deserialize(line)) {
                if (notificationHandler) {
                    notificationHandler(std::make_unique<JSONRPCNotification>(std::move(notification)));
                }
                return;
            }
        } else {
            JSONRPCResponse response;
            if (response.Deserialize(line)) {
                handleResponse(std::move(response));
                return;
            }
        }
        LOG_WARN("ProcessTransport: failed to parse message: {}", line);
    }

    void handleRequest(const JSONRPCRequest& request) {
        auto resp = AnswerInboundRequest(requestHandler, request);
        (void)writeLine(resp->Serialize());
    }

    void handleResponse(JSONRPCResponse response) {
        const std::string idStr = idToString(response.id);
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(idStr);
        if (it != pendingRequests.end()) {
            it->second.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
            pendingRequests.erase(it);
        } else {
            LOG_DEBUG("ProcessTransport: response for unknown id {}", idStr);
        }
        requestDeadlines.erase(idStr);
    }

    // Marks the transport disconnected and fails every pending request. Both happen under requestMutex,
    // so a SendRequest racing with this either registers first and is failed here, or sees the
    // disconnected state and answers itself.
    void failPending(int code, const std::string& message) {
        std::lock_guard<std::mutex> lock(requestMutex);
        connected = false;
        for (auto& [idStr, prom] : pendingRequests) {
            auto resp = std::make_unique<JSONRPCResponse>();
            resp->id = idStr;
            resp->error = CreateErrorObject(code, message, std::nullopt);
            prom.set_value(std::move(resp));
        }
        pendingRequests.clear();
        requestDeadlines.clear();
    }

    std::string generateRequestId() { return "req-" + std::to_string(++requestCounter); }

    /////////////////////////////////////////// Shutdown ///////////////////////////////////////////
    void terminateChild() {
        if (pid <= 0) {
            return;
        }
        int status = 0;
        if (::waitpid(pid, &status, WNOHANG) == pid) {
            pid = -1;
            return;
        }
        ::kill(pid, SIGTERM);
        auto deadline = std::chrono::steady_clock::now() + terminateGrace;
        while (std::chrono::steady_clock::now() < deadline) {
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid || (r < 0 && errno == ECHILD)) {
                pid = -1;
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        LOG_WARN("ProcessTransport: pid {} ignored SIGTERM; sending SIGKILL", static_cast<int>(pid));
        ::kill(pid, SIGKILL);
        ::waitpid(pid, &status, 0);
        pid = -1;
    }

    void shutdown() {
        if (pid <= 0 && !readerThread.joinable() && !timeoutThread.joinable()) {
            return;
        }
        LOG_INFO("ProcessTransport: closing session {}", sessionId);
        stopping = true;
        connected = false;
        {
            std::lock_guard<std::mutex> lock(writeMutex);
            closeFd(stdinFd);
        }
        terminateChild();
        wake();
        if (readerThread.joinable()) {
            readerThread.join();
        }
        if (timeoutThread.joinable()) {
            timeoutThread.join();
        }
        failPending(JSONRPCErrorCodes::ConnectionClosed, "Connection closed");
        closeFd(stdoutFd);
        closeFd(stderrFd);
        closeFd(wakePipe[0]);
        closeFd(wakePipe[1]);
    }
};

ProcessTransport::ProcessTransport(resolver::ResolvedCommand command)
    : pImpl(std::make_unique<Impl>(std::move(command))) { FUNC_SCOPE(); }
ProcessTransport::~ProcessTransport() { FUNC_SCOPE(); }

std::future<void> ProcessTransport::Start() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lifecycle(pImpl->lifecycleMutex);
    std::promise<void> promise;
    auto fut = promise.get_future();
    try {
        pImpl->spawn();
    } catch (const std::system_error& e) {
        LOG_ERROR("ProcessTransport: start failed: {}", e.what());
        promise.set_exception(std::current_exception());
        return fut;
    }
    pImpl->stopping = false;
    pImpl->connected = true;
    pImpl->startReader();
    pImpl->startTimeouts();
    promise.set_value();
    return fut;
}

std::future<void> ProcessTransport::Close() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lifecycle(pImpl->lifecycleMutex);
    pImpl->shutdown();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool ProcessTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->connected; }
std::string ProcessTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }
int ProcessTransport::GetProcessId() const { return static_cast<int>(pImpl->pid); }

std::future<std::unique_ptr<JSONRPCResponse>> ProcessTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    if (!pImpl->connected.load()) {
        LOG_DEBUG("ProcessTransport: SendRequest called while disconnected; returning error");
        promise.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::ConnectionClosed, "Connection closed"));
        return future;
    }
    std::string requestId = idToString(request->id);
    if (requestId.empty()) {
        requestId = pImpl->generateRequestId();
        request->id = requestId;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        if (!pImpl->connected.load()) {
            promise.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::ConnectionClosed, "Connection closed"));
            return future;
        }
        pImpl->pendingRequests[requestId] = std::move(promise);
        if (pImpl->requestTimeout.count() > 0) {
            pImpl->requestDeadlines[requestId] = std::chrono::steady_clock::now() + pImpl->requestTimeout;
        }
    }
    std::string serialized = request->Serialize();
    LOG_DEBUG("ProcessTransport: sending request {} ({} bytes)", requestId, serialized.size());
    if (!pImpl->writeLine(serialized)) {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        auto it = pImpl->pendingRequests.find(requestId);
        if (it != pImpl->pendingRequests.end()) {
            it->second.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::ConnectionClosed, "Connection closed"));
            pImpl->pendingRequests.erase(it);
        }
        pImpl->requestDeadlines.erase(requestId);
    }
    return future;
}

std::future<void> ProcessTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    if (!pImpl->connected.load()) {
        LOG_DEBUG("ProcessTransport: SendNotification called while disconnected; ignoring");
        std::promise<void> ready; ready.set_value(); return ready.get_future();
    }
    std::string serialized = notification->Serialize();
    LOG_DEBUG("ProcessTransport: sending notification {} ({} bytes)", notification->method, serialized.size());
    (void)pImpl->writeLine(serialized);
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

void ProcessTransport::SetNotificationHandler(NotificationHandler handler) { FUNC_SCOPE(); pImpl->notificationHandler = std::move(handler); }
void ProcessTransport::SetRequestHandler(RequestHandler handler) { FUNC_SCOPE(); pImpl->requestHandler = std::move(handler); }
void ProcessTransport::SetErrorHandler(ErrorHandler handler) { FUNC_SCOPE(); pImpl->errorHandler = std::move(handler); }

void ProcessTransport::SetRequestTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->requestTimeout = std::chrono::milliseconds(timeoutMs);
}

void ProcessTransport::SetTerminateGraceMs(uint64_t graceMs) {
    FUNC_SCOPE();
    pImpl->terminateGrace = std::chrono::milliseconds(graceMs);
}

} // namespace toolhost
