// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "hardware-key-qt/lifecycle_binder.h"
#include "hardware-key-qt/connection_coordinator.h"
#include "hardware-key-qt/backends/lifecycle_source.h"
#include <QDebug>

namespace HardwareKey {

LifecycleBinder::LifecycleBinder(ConnectionCoordinator& coordinator, LifecycleSource* source)
    : m_coordinator(coordinator)
    , m_source(source)
{
}

LifecycleBinder::~LifecycleBinder()
{
    detach();
}

bool LifecycleBinder::attach()
{
    if (m_attached) {
        return true;
    }
    if (!m_source) {
        qWarning() << "LifecycleBinder: No lifecycle source available!";
        return false;
    }

    m_attached = m_source->registerObserver(this);
    if (!m_attached) {
        qWarning() << "LifecycleBinder: Lifecycle source rejected registration";
    }
    return m_attached;
}

void LifecycleBinder::detach()
{
    if (!m_attached) {
        return;
    }
    m_attached = false;

    if (m_source && !m_source->unregisterObserver(this)) {
        qWarning() << "LifecycleBinder: Unregistering from lifecycle source failed";
    }
}

void LifecycleBinder::onLifecycleEvent(SurfacePhase phase)
{
    qDebug() << "LifecycleBinder: Surface" << phase;

    if (m_destroyed) {
        qWarning() << "LifecycleBinder: Event after Destroyed ignored:" << phase;
        return;
    }

    switch (phase) {
        case SurfacePhase::Created:
            break;

        case SurfacePhase::Started:
            m_started = true;
            m_coordinator.onSurfaceStarted();
            break;

        case SurfacePhase::Resumed:
            m_resumed = true;
            m_coordinator.onSurfaceResumed();
            break;

        case SurfacePhase::Paused:
            m_coordinator.onSurfacePaused();
            m_resumed = false;
            break;

        case SurfacePhase::Stopped:
            m_started = false;
            m_coordinator.onSurfaceStopped();
            break;

        case SurfacePhase::Destroyed:
            m_resumed = false;
            m_started = false;
            m_destroyed = true;
            m_coordinator.onSurfaceDestroyed();
            detach();
            break;
    }
}

} // namespace HardwareKey
