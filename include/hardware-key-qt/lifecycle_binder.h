#pragma once

#include "observers.h"
#include <QPointer>

namespace HardwareKey {

class ConnectionCoordinator;
class LifecycleSource;

/**
 * @brief Drives the coordinator from host-surface lifecycle events
 *
 * Phase -> coordinator hook:
 * - Started   -> onSurfaceStarted()
 * - Resumed   -> resumed = true, onSurfaceResumed()
 * - Paused    -> onSurfacePaused(), resumed = false
 * - Stopped   -> onSurfaceStopped()
 * - Destroyed -> onSurfaceDestroyed(), then unregisters from the source
 *
 * The resumed flag is written only here and read by ProximityChannel.
 */
class LifecycleBinder : public LifecycleObserver {
public:
    LifecycleBinder(ConnectionCoordinator& coordinator, LifecycleSource* source);
    ~LifecycleBinder() override;

    LifecycleBinder(const LifecycleBinder&) = delete;
    LifecycleBinder& operator=(const LifecycleBinder&) = delete;

    /**
     * @brief Register with the lifecycle source
     * @return true if registered after the call
     */
    bool attach();

    /**
     * @brief Unregister from the lifecycle source; safe when not attached
     */
    void detach();

    bool isAttached() const { return m_attached; }

    /// Surface is visible (between Started and Stopped)
    bool isStarted() const { return m_started; }

    /// Surface is in front (between Resumed and Paused)
    bool isResumed() const { return m_resumed; }

    bool isDestroyed() const { return m_destroyed; }

    void onLifecycleEvent(SurfacePhase phase) override;

private:
    ConnectionCoordinator& m_coordinator;
    QPointer<LifecycleSource> m_source;
    bool m_attached = false;
    bool m_started = false;
    bool m_resumed = false;
    bool m_destroyed = false;
};

} // namespace HardwareKey
