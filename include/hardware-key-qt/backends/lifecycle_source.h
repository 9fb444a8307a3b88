#pragma once

#include "../observers.h"
#include <QObject>

namespace HardwareKey {

/**
 * @brief Emitter of host-surface lifecycle events
 *
 * Delivers the six SurfacePhase events of one host surface to the
 * registered observers, in order: Created, then any number of
 * Started/Resumed/Paused/Stopped cycles, then Destroyed.
 */
class LifecycleSource : public QObject
{
    Q_OBJECT

public:
    explicit LifecycleSource(QObject* parent = nullptr) : QObject(parent) {}
    virtual ~LifecycleSource() = default;

    /**
     * @brief Start delivering events to an observer
     * @return false if the observer is already registered
     */
    virtual bool registerObserver(LifecycleObserver* observer) = 0;

    /**
     * @brief Stop delivering events to an observer
     * @return false if the observer was not registered
     */
    virtual bool unregisterObserver(LifecycleObserver* observer) = 0;
};

} // namespace HardwareKey
