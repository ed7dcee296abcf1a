#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace voxturn {

/**
 * Tagged line logger shared by every component of a session.
 * Output looks like "[Session] Recording audio request."
 */
class Logger {
public:
    Logger(std::ostream& out = std::cout, std::ostream& err = std::cerr)
        : out_(out), err_(err) {}

    void setVerbose(bool verbose) { verbose_.store(verbose); }
    bool verbose() const { return verbose_.load(); }

    void debug(const std::string& tag, const std::string& msg) {
        if (!verbose_.load()) return;
        write(out_, tag, msg);
    }
    void info(const std::string& tag, const std::string& msg)  { write(out_, tag, msg); }
    void warn(const std::string& tag, const std::string& msg)  { write(err_, tag, "⚠️  " + msg); }
    void error(const std::string& tag, const std::string& msg) { write(err_, tag, "❌ " + msg); }

private:
    void write(std::ostream& os, const std::string& tag, const std::string& msg) {
        std::lock_guard<std::mutex> lk(mtx_);
        os << "[" << tag << "] " << msg << std::endl;
    }

    std::ostream& out_;
    std::ostream& err_;
    std::mutex mtx_;
    std::atomic<bool> verbose_{false};
};

// Process-wide counters, printed on shutdown.
struct Counters {
    std::atomic<uint64_t> turns{0};
    std::atomic<uint64_t> attempts{0};
    std::atomic<uint64_t> retries{0};
    std::atomic<uint64_t> device_actions{0};
    std::atomic<uint64_t> malformed_actions{0};
    std::atomic<uint64_t> failed_actions{0};
    std::atomic<uint64_t> audio_bytes_in{0};
    std::atomic<uint64_t> audio_bytes_out{0};
};

class Context {
public:
    Context() = default;
    Context(std::ostream& out, std::ostream& err) : logger_(out, err) {}

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    Logger& log() { return logger_; }
    Counters& counters() { return counters_; }

    void printCounters() {
        logger_.info("Stats",
            "turns=" + std::to_string(counters_.turns.load()) +
            " attempts=" + std::to_string(counters_.attempts.load()) +
            " retries=" + std::to_string(counters_.retries.load()) +
            " device_actions=" + std::to_string(counters_.device_actions.load()) +
            " malformed=" + std::to_string(counters_.malformed_actions.load()) +
            " failed=" + std::to_string(counters_.failed_actions.load()) +
            " audio_in=" + std::to_string(counters_.audio_bytes_in.load()) + "B" +
            " audio_out=" + std::to_string(counters_.audio_bytes_out.load()) + "B");
    }

private:
    Logger logger_;
    Counters counters_;
};

} // namespace voxturn
