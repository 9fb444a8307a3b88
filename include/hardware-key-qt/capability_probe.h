#pragma once

#include "types.h"
#include "backends/platform_backend.h"
#include <QPointer>

namespace HardwareKey {

/**
 * @brief Reports which connection methods the platform offers right now
 *
 * Stateless: every call queries the platform again, because proximity
 * sensing can be switched on and off while the application runs.
 */
class CapabilityProbe {
public:
    /**
     * @param backend Platform to query; an empty set is reported once it is gone
     */
    explicit CapabilityProbe(const PlatformBackend* backend);

    /**
     * @brief Query the platform
     * @return Wired if host mode is present, Proximity if NFC is present
     *         and enabled. May be empty.
     */
    ConnectionMethods query() const;

private:
    QPointer<const PlatformBackend> m_backend;
};

} // namespace HardwareKey
