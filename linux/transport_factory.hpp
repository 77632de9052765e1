#pragma once

#include <memory>

#include "ptz_config.hpp"
#include "ptz_platform.hpp"
#include "transport.hpp"

namespace pan_tilt {

/**
 * Создать транспорт по config.kind.
 * Транспорт возвращается закрытым; открывает его контроллер.
 */
[[nodiscard]] std::unique_ptr<Transport> MakeTransport(
    PtzPlatform& platform, const ConnectionConfig& config);

}  // namespace pan_tilt
