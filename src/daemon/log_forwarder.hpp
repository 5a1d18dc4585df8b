#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

class LogSink;

/// Pumps one output stream of the engine into the log sink, line by line,
/// on its own thread. Owns the file descriptor.
class LogForwarder {
public:
    LogForwarder(int fd, std::shared_ptr<LogSink> sink);
    ~LogForwarder();

    LogForwarder(const LogForwarder&) = delete;
    LogForwarder& operator=(const LogForwarder&) = delete;

    /// Ask the reader to finish: it drains whatever is already buffered in
    /// the pipe, then exits. Blocks until the thread is joined.
    void stop();

    /// Domain a line belongs to, judged by its content. Unrecognised lines
    /// belong to "engine".
    static std::string classify_line(const std::string& line);

private:
    int fd_;
    std::shared_ptr<LogSink> sink_;
    std::atomic<bool> stop_requested_{false};
    std::thread thread_;

    void read_loop();
    void forward(std::string line);
};
