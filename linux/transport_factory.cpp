#include "transport_factory.hpp"

#include "network_transport.hpp"
#include "serial_transport.hpp"
#include "simulator_transport.hpp"

namespace pan_tilt {

std::unique_ptr<Transport> MakeTransport(PtzPlatform& platform,
                                         const ConnectionConfig& config) {
  switch (config.kind) {
    case TransportKind::Serial:
      return std::make_unique<SerialTransport>(platform, config);
    case TransportKind::Network:
      return std::make_unique<NetworkTransport>(platform, config);
    case TransportKind::Simulator:
      return std::make_unique<SimulatorTransport>(platform, config);
  }
  return nullptr;
}

}  // namespace pan_tilt
