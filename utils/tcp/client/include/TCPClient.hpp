#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <netinet/in.h>

#include "logger.hpp"

class TCPClient {
public:
  TCPClient(const std::string& host, uint16_t port, Logger& logger);
  ~TCPClient();

  TCPClient(const TCPClient&) = delete;
  TCPClient& operator=(const TCPClient&) = delete;

  void connect();
  void send(const std::vector<uint8_t>& data);
  void send(const std::string& text);
  std::vector<uint8_t> receive();
  std::string receive_text();
  void close();

private:
  std::string host_;
  uint16_t port_;
  int sock_fd_;
  Logger& logger_;
  bool connected_;
};
