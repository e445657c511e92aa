#include "hashrig/net_platform.hpp"

#include "hashrig/errors.hpp"

namespace hashrig {

SocketHandle invalid_socket_handle() {
  return static_cast<SocketHandle>(-1);
}

void initialize_network_stack_once() {
}

SocketHandle connect_tcp_socket(const std::string& host, uint16_t port, uint32_t) {
  throw TransportError("cannot connect to " + host + ":" + std::to_string(port) +
                       ": network stack is unavailable on this platform build");
}

SocketHandle listen_tcp_socket(const std::string& host, uint16_t port, int) {
  throw TransportError("cannot listen on " + host + ":" + std::to_string(port) +
                       ": network stack is unavailable on this platform build");
}

SocketHandle accept_tcp_socket(SocketHandle) {
  return invalid_socket_handle();
}

uint16_t socket_local_port(SocketHandle) {
  return 0;
}

void interrupt_socket_handle(SocketHandle) {
}

void close_socket_handle(SocketHandle) {
}

size_t send_socket_data(SocketHandle, const uint8_t*, size_t) {
  throw TransportError("socket send failed: network stack is unavailable on this platform build");
}

size_t recv_socket_data(SocketHandle, uint8_t*, size_t) {
  return 0;
}

bool socket_wait_readable(SocketHandle, uint32_t) {
  return false;
}

bool socket_wait_writable(SocketHandle, uint32_t) {
  return false;
}

std::vector<LocalInterface> local_ipv4_interfaces() {
  return {};
}

} // namespace hashrig
