#include "hashrig/net_platform.hpp"

#include "hashrig/errors.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <ifaddrs.h>
#include <limits>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hashrig {

namespace {

std::string endpoint_text(const std::string& host, uint16_t port) {
  return host + ":" + std::to_string(port);
}

bool set_nonblocking(int sock, bool enabled) {
  const int flags = fcntl(sock, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  const int wanted = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return fcntl(sock, F_SETFL, wanted) == 0;
}

// Non-blocking connect bounded by select() on writability.
bool connect_with_timeout(int sock, const sockaddr* addr, socklen_t addr_len, uint32_t timeout_ms) {
  if (!set_nonblocking(sock, true)) {
    return false;
  }

  int rc = ::connect(sock, addr, addr_len);
  if (rc != 0 && errno != EINPROGRESS) {
    return false;
  }

  if (rc != 0) {
    fd_set writefds;
    FD_ZERO(&writefds);
    FD_SET(sock, &writefds);
    timeval tv{};
    tv.tv_sec = static_cast<long>(timeout_ms / 1000U);
    tv.tv_usec = static_cast<long>((timeout_ms % 1000U) * 1000U);

    rc = select(sock + 1, nullptr, &writefds, nullptr, &tv);
    if (rc <= 0) {
      errno = rc == 0 ? ETIMEDOUT : errno;
      return false;
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
      return false;
    }
    if (so_error != 0) {
      errno = so_error;
      return false;
    }
  }

  return set_nonblocking(sock, false);
}

uint32_t netmask_prefix_len(const sockaddr* mask) {
  if (mask == nullptr || mask->sa_family != AF_INET) {
    return 0;
  }
  const auto* in = reinterpret_cast<const sockaddr_in*>(mask);
  return static_cast<uint32_t>(__builtin_popcount(ntohl(in->sin_addr.s_addr)));
}

bool wait_socket_ready(SocketHandle raw_socket, uint32_t timeout_ms, bool for_write) {
  const int sock = static_cast<int>(raw_socket);
  if (sock < 0) {
    return false;
  }

  fd_set fds;
  FD_ZERO(&fds);
  FD_SET(sock, &fds);

  timeval tv{};
  timeval* ptv = nullptr;
  if (timeout_ms != std::numeric_limits<uint32_t>::max()) {
    tv.tv_sec = static_cast<long>(timeout_ms / 1000U);
    tv.tv_usec = static_cast<long>((timeout_ms % 1000U) * 1000U);
    ptv = &tv;
  }

  const int rc = for_write ? select(sock + 1, nullptr, &fds, nullptr, ptv)
                           : select(sock + 1, &fds, nullptr, nullptr, ptv);
  return rc > 0 && FD_ISSET(sock, &fds);
}

} // namespace

SocketHandle invalid_socket_handle() {
  return static_cast<SocketHandle>(-1);
}

void initialize_network_stack_once() {
}

SocketHandle connect_tcp_socket(const std::string& host, uint16_t port, uint32_t timeout_ms) {
  const std::string port_str = std::to_string(port);

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  const int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
  if (gai != 0) {
    throw TransportError("failed to resolve " + endpoint_text(host, port) + ": " + gai_strerror(gai));
  }

  int sock = -1;
  int last_errno = 0;
  for (auto* ptr = result; ptr != nullptr; ptr = ptr->ai_next) {
    sock = socket(ptr->ai_family, ptr->ai_socktype, ptr->ai_protocol);
    if (sock < 0) {
      last_errno = errno;
      continue;
    }

    const socklen_t addr_len = static_cast<socklen_t>(ptr->ai_addrlen);
    const bool connected = timeout_ms == 0
      ? ::connect(sock, ptr->ai_addr, addr_len) == 0
      : connect_with_timeout(sock, ptr->ai_addr, addr_len, timeout_ms);
    if (connected) {
      break;
    }

    last_errno = errno;
    close(sock);
    sock = -1;
  }

  freeaddrinfo(result);

  if (sock < 0) {
    const std::string reason = last_errno == 0 ? "no usable address" : std::strerror(last_errno);
    throw TransportError("failed to connect to " + endpoint_text(host, port) + ": " + reason);
  }

  const int one = 1;
  (void)setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  return static_cast<SocketHandle>(sock);
}

SocketHandle listen_tcp_socket(const std::string& host, uint16_t port, int backlog) {
  const int sock = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
  if (sock < 0) {
    throw TransportError(std::string("socket() failed: ") + std::strerror(errno));
  }

  const int one = 1;
  (void)setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (host.empty() || host == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    close(sock);
    throw TransportError("invalid listen address " + host);
  }

  if (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    const int err = errno;
    close(sock);
    throw TransportError("failed to bind " + endpoint_text(host, port) + ": " + std::strerror(err));
  }
  if (listen(sock, backlog) != 0) {
    const int err = errno;
    close(sock);
    throw TransportError("failed to listen on " + endpoint_text(host, port) + ": " + std::strerror(err));
  }

  return static_cast<SocketHandle>(sock);
}

SocketHandle accept_tcp_socket(SocketHandle listener) {
  while (true) {
    const int client = accept(static_cast<int>(listener), nullptr, nullptr);
    if (client >= 0) {
      const int one = 1;
      (void)setsockopt(client, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      return static_cast<SocketHandle>(client);
    }
    if (errno == EINTR || errno == ECONNABORTED) {
      continue;
    }
    return invalid_socket_handle();
  }
}

uint16_t socket_local_port(SocketHandle sock) {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (getsockname(static_cast<int>(sock), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return 0;
  }
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
  }
  return 0;
}

void interrupt_socket_handle(SocketHandle sock) {
  if (sock == invalid_socket_handle()) {
    return;
  }
  (void)shutdown(static_cast<int>(sock), SHUT_RDWR);
}

void close_socket_handle(SocketHandle sock) {
  if (sock == invalid_socket_handle()) {
    return;
  }
  (void)close(static_cast<int>(sock));
}

size_t send_socket_data(SocketHandle sock, const uint8_t* data, size_t len) {
  const ssize_t n = send(static_cast<int>(sock), data, len, MSG_NOSIGNAL | MSG_DONTWAIT);
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return 0;
    }
    throw TransportError(std::string("socket send failed: ") + std::strerror(errno));
  }
  return static_cast<size_t>(n);
}

size_t recv_socket_data(SocketHandle sock, uint8_t* data, size_t len) {
  const ssize_t n = recv(static_cast<int>(sock), data, len, 0);
  if (n <= 0) {
    return 0;
  }
  return static_cast<size_t>(n);
}

bool socket_wait_readable(SocketHandle sock, uint32_t timeout_ms) {
  return wait_socket_ready(sock, timeout_ms, false);
}

bool socket_wait_writable(SocketHandle sock, uint32_t timeout_ms) {
  return wait_socket_ready(sock, timeout_ms, true);
}

std::vector<LocalInterface> local_ipv4_interfaces() {
  std::vector<LocalInterface> out;

  ifaddrs* addrs = nullptr;
  if (getifaddrs(&addrs) != 0) {
    return out;
  }

  for (auto* it = addrs; it != nullptr; it = it->ifa_next) {
    if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    const auto* in = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
    char text[INET_ADDRSTRLEN] = {};
    if (inet_ntop(AF_INET, &in->sin_addr, text, sizeof(text)) == nullptr) {
      continue;
    }

    LocalInterface iface;
    iface.name = it->ifa_name == nullptr ? "" : it->ifa_name;
    iface.ipv4 = text;
    iface.prefix_len = netmask_prefix_len(it->ifa_netmask);
    iface.up = (it->ifa_flags & IFF_UP) != 0;
    iface.loopback = (it->ifa_flags & IFF_LOOPBACK) != 0;
    out.push_back(std::move(iface));
  }

  freeifaddrs(addrs);
  return out;
}

} // namespace hashrig
