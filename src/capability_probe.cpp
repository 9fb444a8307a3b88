// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "hardware-key-qt/capability_probe.h"
#include "hardware-key-qt/backends/platform_backend.h"

namespace HardwareKey {

CapabilityProbe::CapabilityProbe(const PlatformBackend* backend)
    : m_backend(backend)
{
}

ConnectionMethods CapabilityProbe::query() const
{
    ConnectionMethods result;
    if (!m_backend) {
        return result;
    }

    if (m_backend->hasWiredHostMode()) {
        result |= ConnectionMethod::Wired;
    }

    if (m_backend->hasProximitySupport() && m_backend->isProximityEnabled()) {
        result |= ConnectionMethod::Proximity;
    }

    return result;
}

} // namespace HardwareKey
