#include "daemon/log_forwarder.hpp"
#include "core/logging.hpp"

#include <poll.h>
#include <unistd.h>
#include <cerrno>

LogForwarder::LogForwarder(int fd, std::shared_ptr<LogSink> sink)
    : fd_(fd), sink_(std::move(sink)) {
    if (fd_ >= 0) {
        thread_ = std::thread(&LogForwarder::read_loop, this);
    }
}

LogForwarder::~LogForwarder() {
    stop();
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

void LogForwarder::stop() {
    stop_requested_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::string LogForwarder::classify_line(const std::string& line) {
    if (line.find("[SCRIPT]") != std::string::npos) return "script";
    if (line.find("[PLUGIN]") != std::string::npos) return "plugin";
    if (line.find("[AUDIT]") != std::string::npos) return "audit";
    if (line.find("[CRASH]") != std::string::npos) return "crash";
    return "engine";
}

void LogForwarder::forward(std::string line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty() || !sink_) return;
    sink_->write(classify_line(line), line);
}

void LogForwarder::read_loop() {
    std::string pending;
    char buf[4096];

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;

    while (true) {
        int ret = poll(&pfd, 1, 200);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) {
            // Nothing buffered in the pipe
            if (stop_requested_.load()) break;
            continue;
        }

        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break;  // EOF: every writer is gone

        pending.append(buf, static_cast<size_t>(n));
        size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            forward(pending.substr(0, pos));
            pending.erase(0, pos + 1);
        }
        // Guard against a writer that never emits a newline
        if (pending.size() > 64 * 1024) {
            forward(std::move(pending));
            pending.clear();
        }
    }

    if (!pending.empty()) {
        forward(std::move(pending));
    }
}
