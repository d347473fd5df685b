/*
 * Copyright (c) 2024 Aurora Poller Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "tcp_bridge_backend.hpp"

#include <cerrno>
#include <cstring>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <rclcpp/rclcpp.hpp>

namespace aurora
{
namespace serial
{

TcpBridgeBackend::~TcpBridgeBackend()
{
  close();
}

bool TcpBridgeBackend::splitAddress(
  const std::string & address, std::string & host,
  std::string & port)
{
  auto pos = address.rfind(':');
  if (pos == std::string::npos || pos == 0 || pos + 1 >= address.size()) {
    return false;
  }
  host = address.substr(0, pos);
  port = address.substr(pos + 1);
  // Allow [v6::addr]:port
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  for (char c : port) {
    if (c < '0' || c > '9') {return false;}
  }
  return !host.empty();
}

bool TcpBridgeBackend::open(const SerialOptions & opts)
{
  close();
  opts_ = opts;

  std::string host, port;
  if (!splitAddress(opts.device, host, port)) {
    RCLCPP_ERROR(
      rclcpp::get_logger("TcpBridgeBackend"), "Invalid bridge address '%s' (expected host:port)",
      opts.device.c_str());
    return false;
  }

  addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo * results = nullptr;
  int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &results);
  if (rc != 0) {
    RCLCPP_ERROR(
      rclcpp::get_logger("TcpBridgeBackend"), "Cannot resolve %s: %s",
      host.c_str(), ::gai_strerror(rc));
    return false;
  }

  for (addrinfo * ai = results; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      socket_fd_ = fd;
      break;
    }
    ::close(fd);
  }
  ::freeaddrinfo(results);

  if (socket_fd_ < 0) {
    RCLCPP_ERROR(
      rclcpp::get_logger("TcpBridgeBackend"), "Connection to %s failed: %s",
      opts.device.c_str(), std::strerror(errno));
    return false;
  }

  // Frames are tiny; do not let Nagle hold them back
  int one = 1;
  if (::setsockopt(socket_fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) != 0) {
    RCLCPP_WARN(
      rclcpp::get_logger("TcpBridgeBackend"), "TCP_NODELAY not set: %s", std::strerror(errno));
  }

  RCLCPP_INFO(rclcpp::get_logger("TcpBridgeBackend"), "Connected to %s", opts.device.c_str());
  return true;
}

void TcpBridgeBackend::close()
{
  if (socket_fd_ >= 0) {
    ::close(socket_fd_);
    socket_fd_ = -1;
  }
}

bool TcpBridgeBackend::is_open() const
{
  return socket_fd_ >= 0;
}

int TcpBridgeBackend::read(uint8_t * buf, size_t len)
{
  if (socket_fd_ < 0) {
    return -1;
  }

  pollfd pfd;
  pfd.fd = socket_fd_;
  pfd.events = POLLIN;
  pfd.revents = 0;

  int ready = ::poll(&pfd, 1, opts_.read_timeout_ms);
  if (ready == 0) {
    return 0;
  }
  if (ready < 0) {
    if (errno == EINTR) {
      return 0;
    }
    RCLCPP_ERROR(
      rclcpp::get_logger("TcpBridgeBackend"), "poll failed: %s", std::strerror(errno));
    return -1;
  }

  ssize_t received = ::recv(socket_fd_, buf, len, 0);
  if (received == 0) {
    RCLCPP_ERROR(rclcpp::get_logger("TcpBridgeBackend"), "Bridge closed the connection");
    return -1;
  }
  if (received < 0) {
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      return 0;
    }
    RCLCPP_ERROR(
      rclcpp::get_logger("TcpBridgeBackend"), "recv failed: %s", std::strerror(errno));
    return -1;
  }
  return static_cast<int>(received);
}

int TcpBridgeBackend::write(const uint8_t * buf, size_t len)
{
  if (socket_fd_ < 0) {
    return -1;
  }

  size_t sent_total = 0;
  while (sent_total < len) {
    pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLOUT;
    pfd.revents = 0;

    int ready = ::poll(&pfd, 1, opts_.write_timeout_ms);
    if (ready == 0) {
      break;          // partial write, caller decides
    }
    if (ready < 0) {
      if (errno == EINTR) {continue;}
      return -1;
    }

    ssize_t sent = ::send(socket_fd_, buf + sent_total, len - sent_total, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {continue;}
      RCLCPP_ERROR(
        rclcpp::get_logger("TcpBridgeBackend"), "send failed: %s", std::strerror(errno));
      return -1;
    }
    sent_total += static_cast<size_t>(sent);
  }
  return static_cast<int>(sent_total);
}

std::string TcpBridgeBackend::describe() const
{
  return "tcp://" + opts_.device;
}

} // namespace serial
} // namespace aurora
