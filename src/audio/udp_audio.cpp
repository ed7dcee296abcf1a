#include "audio/udp_audio.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

namespace voxturn {

static std::string ipv4_of_iface(const std::string& ifname) {
  struct ifaddrs *ifaddr = nullptr;
  if (getifaddrs(&ifaddr) != 0) return "";
  std::string result;
  for (auto* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
    if (ifname != ifa->ifa_name) continue;
    char host[NI_MAXHOST] = {0};
    if (getnameinfo(ifa->ifa_addr, sizeof(struct sockaddr_in), host, NI_MAXHOST, NULL, 0, NI_NUMERICHOST) == 0) {
      result = host; break;
    }
  }
  freeifaddrs(ifaddr);
  return result;
}

// ---------- multicast microphone ----------

UdpMulticastSource::UdpMulticastSource(Context& ctx, Options opts)
: ctx_(ctx), opts_(std::move(opts)) {}

UdpMulticastSource::~UdpMulticastSource() { close(); }

void UdpMulticastSource::joinGroup() {
  sock_ = socket(AF_INET, SOCK_DGRAM, 0);
  if (sock_ < 0) throw std::runtime_error(std::string("UDP mic socket: ") + std::strerror(errno));

  // Allow quick rebind if restarted
  int reuse = 1;
  setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, (char *)&reuse, sizeof(reuse));
  // short receive timeout so stop() is noticed
  timeval tv{0, 100000};
  setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  sockaddr_in local_addr{}; local_addr.sin_family = AF_INET; local_addr.sin_port = htons(opts_.port);
  local_addr.sin_addr.s_addr = INADDR_ANY;
  if (bind(sock_, (sockaddr *)&local_addr, sizeof(local_addr)) < 0) {
    ::close(sock_); sock_ = -1;
    throw std::runtime_error("UDP mic bind to port " + std::to_string(opts_.port) + " failed");
  }

  std::string iface_ip = opts_.iface_name.empty() ? std::string() : ipv4_of_iface(opts_.iface_name);
  if (iface_ip.empty()) {
    ctx_.log().warn("UDP Mic", "Could not resolve IPv4 of iface '" + opts_.iface_name + "'. Falling back to system default.");
  } else {
    ctx_.log().debug("UDP Mic", "Local iface " + opts_.iface_name + " IPv4: " + iface_ip);
  }

  if (inet_pton(AF_INET, opts_.group_ip.c_str(), &mreq_.imr_multiaddr) != 1) {
    ::close(sock_); sock_ = -1;
    throw std::runtime_error("invalid multicast address: " + opts_.group_ip);
  }
  mreq_.imr_interface.s_addr = iface_ip.empty() ? htonl(INADDR_ANY) : inet_addr(iface_ip.c_str());

  if (setsockopt(sock_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq_, sizeof(mreq_)) < 0) {
    ::close(sock_); sock_ = -1;
    throw std::runtime_error("join group " + opts_.group_ip + " on iface " + opts_.iface_name + " failed");
  }
  ctx_.log().info("UDP Mic", "✅ Joined multicast " + opts_.group_ip + ":" + std::to_string(opts_.port) +
                  " on " + (iface_ip.empty() ? std::string("default-iface") : opts_.iface_name));
}

void UdpMulticastSource::start() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (sock_ < 0) joinGroup();
  pending_.clear();
  running_.store(true);
}

void UdpMulticastSource::stop() {
  running_.store(false);
}

AudioBytes UdpMulticastSource::read(size_t size) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (sock_ < 0) return {};
  uint8_t buffer[2048];
  while (pending_.size() < size) {
    if (!running_.load()) return {};
    ssize_t len = recvfrom(sock_, buffer, sizeof(buffer), 0, nullptr, nullptr);
    if (len > 0) {
      pending_.insert(pending_.end(), buffer, buffer + len);
    } else if (len < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      ctx_.log().error("UDP Mic", std::string("recvfrom: ") + std::strerror(errno));
      return {};
    }
  }
  AudioBytes out(pending_.begin(), pending_.begin() + size);
  pending_.erase(pending_.begin(), pending_.begin() + size);
  return out;
}

void UdpMulticastSource::close() {
  running_.store(false);
  std::lock_guard<std::mutex> lk(mtx_);
  if (sock_ < 0) return;
  setsockopt(sock_, IPPROTO_IP, IP_DROP_MEMBERSHIP, &mreq_, sizeof(mreq_));
  ::close(sock_); sock_ = -1;
  ctx_.log().info("UDP Mic", "✅ UDP microphone capture stopped");
}

// ---------- speaker ----------

UdpSink::UdpSink(Context& ctx, const std::string& host, int port, size_t max_datagram)
: ctx_(ctx), max_datagram_(max_datagram ? max_datagram : 1024) {
  dest_.sin_family = AF_INET;
  dest_.sin_port = htons(port);
  if (inet_pton(AF_INET, host.c_str(), &dest_.sin_addr) != 1) {
    throw std::runtime_error("invalid UDP speaker address: " + host);
  }
  sock_ = socket(AF_INET, SOCK_DGRAM, 0);
  if (sock_ < 0) throw std::runtime_error(std::string("UDP speaker socket: ") + std::strerror(errno));
  ctx_.log().info("UDP Speaker", "Sending audio to " + host + ":" + std::to_string(port));
}

UdpSink::~UdpSink() { close(); }

void UdpSink::write(const AudioBytes& data) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (sock_ < 0) throw std::runtime_error("UDP speaker is closed");
  for (size_t off = 0; off < data.size(); off += max_datagram_) {
    size_t n = std::min(max_datagram_, data.size() - off);
    ssize_t sent = sendto(sock_, data.data() + off, n, 0, (sockaddr *)&dest_, sizeof(dest_));
    if (sent < 0) {
      ctx_.log().warn("UDP Speaker", std::string("sendto: ") + std::strerror(errno));
      return;
    }
  }
}

void UdpSink::close() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (sock_ < 0) return;
  ::close(sock_); sock_ = -1;
}

} // namespace voxturn
