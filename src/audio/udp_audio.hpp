#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include <netinet/in.h>

#include <voxturn/audio/conversation_stream.hpp>
#include <voxturn/core/context.hpp>

namespace voxturn {

// Microphone fed by 16-bit mono PCM datagrams on a multicast group.
class UdpMulticastSource : public AudioSource {
public:
    struct Options {
        std::string group_ip = "239.168.123.161";
        int port = 5555;
        std::string iface_name = "eth0"; // empty: system default
    };

    UdpMulticastSource(Context& ctx, Options opts);
    ~UdpMulticastSource() override;

    void start() override;
    void stop() override;
    AudioBytes read(size_t size) override;
    void close() override;

private:
    void joinGroup();

    Context& ctx_;
    Options opts_;
    int sock_ = -1;
    ip_mreq mreq_{};
    std::atomic<bool> running_{false};
    AudioBytes pending_;
    std::mutex mtx_;
};

// Speaker that forwards PCM to a UDP endpoint.
class UdpSink : public AudioSink {
public:
    UdpSink(Context& ctx, const std::string& host, int port, size_t max_datagram = 1024);
    ~UdpSink() override;

    void write(const AudioBytes& data) override;
    void close() override;

private:
    Context& ctx_;
    int sock_ = -1;
    sockaddr_in dest_{};
    size_t max_datagram_;
    std::mutex mtx_;
};

} // namespace voxturn
