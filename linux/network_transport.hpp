#pragma once

#include "transport.hpp"

namespace pan_tilt {

/**
 * TCP-транспорт (serial-over-IP конвертер).
 *
 * Кадры идут по сокету без изменений; чтение через poll с таймаутом.
 */
class NetworkTransport final : public Transport {
 public:
  NetworkTransport(PtzPlatform& platform, ConnectionConfig config);
  ~NetworkTransport() override;

 protected:
  TransportResult<bool> DoOpen(const ConnectionConfig& config) override;
  void DoClose() override;
  [[nodiscard]] bool DoIsOpen() const override;
  TransportResult<size_t> DoWrite(std::span<const uint8_t> data) override;
  TransportResult<size_t> DoRead(std::span<uint8_t> buffer,
                                 uint32_t timeout_ms) override;

 private:
  int fd_{-1};
  uint32_t connect_timeout_ms_{0};
};

}  // namespace pan_tilt
