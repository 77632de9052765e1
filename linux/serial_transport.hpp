#pragma once

#include "transport.hpp"

namespace pan_tilt {

/**
 * Последовательный порт (termios).
 *
 * Порт открывается в неканоническом режиме без управления потоком и
 * блокируется flock(LOCK_EX | LOCK_NB), чтобы второй процесс получил Busy.
 */
class SerialTransport final : public Transport {
 public:
  SerialTransport(PtzPlatform& platform, ConnectionConfig config);
  ~SerialTransport() override;

 protected:
  TransportResult<bool> DoOpen(const ConnectionConfig& config) override;
  void DoClose() override;
  [[nodiscard]] bool DoIsOpen() const override;
  TransportResult<size_t> DoWrite(std::span<const uint8_t> data) override;
  TransportResult<size_t> DoRead(std::span<uint8_t> buffer,
                                 uint32_t timeout_ms) override;

 private:
  int fd_{-1};
  uint32_t write_timeout_ms_{0};
};

}  // namespace pan_tilt
