#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hashrig {

using SocketHandle = std::intptr_t;

struct LocalInterface {
  std::string name;
  std::string ipv4;
  uint32_t prefix_len = 0;
  bool up = false;
  bool loopback = false;
};

SocketHandle invalid_socket_handle();
void initialize_network_stack_once();

// timeout_ms == 0 blocks until the OS gives up on the handshake.
SocketHandle connect_tcp_socket(const std::string& host, uint16_t port, uint32_t timeout_ms = 0);
SocketHandle listen_tcp_socket(const std::string& host, uint16_t port, int backlog = 64);
// Returns invalid_socket_handle() once the listener is shut down.
SocketHandle accept_tcp_socket(SocketHandle listener);
uint16_t socket_local_port(SocketHandle sock);

void interrupt_socket_handle(SocketHandle sock);
void close_socket_handle(SocketHandle sock);
// Never blocks: returns 0 when the send buffer is full and throws
// TransportError once the connection is broken.
size_t send_socket_data(SocketHandle sock, const uint8_t* data, size_t len);
size_t recv_socket_data(SocketHandle sock, uint8_t* data, size_t len);
// UINT32_MAX waits without a limit.
bool socket_wait_readable(SocketHandle sock, uint32_t timeout_ms);
bool socket_wait_writable(SocketHandle sock, uint32_t timeout_ms);

std::vector<LocalInterface> local_ipv4_interfaces();

} // namespace hashrig
