#pragma once

#include "lifecycle_source.h"
#include <QList>
#include <QSet>

namespace HardwareKey {

/**
 * @brief Lifecycle source backed by the Qt application state
 *
 * Maps Qt::ApplicationState onto surface phases:
 * - Qt::ApplicationActive                           -> Resumed
 * - Qt::ApplicationInactive                         -> Started (Paused if coming from Active)
 * - Qt::ApplicationHidden, Qt::ApplicationSuspended -> Stopped
 *
 * Transitions are walked one phase at a time, so Hidden -> Active yields
 * Started then Resumed. QCoreApplication::aboutToQuit delivers Destroyed.
 *
 * Without a QGuiApplication (console tools) the surface counts as always
 * resumed.
 *
 * A newly registered observer gets Created, then the phases needed to reach
 * the current state, from the event loop.
 */
class ApplicationLifecycleSource : public LifecycleSource
{
    Q_OBJECT

public:
    explicit ApplicationLifecycleSource(QObject* parent = nullptr);
    ~ApplicationLifecycleSource() override;

    bool registerObserver(LifecycleObserver* observer) override;
    bool unregisterObserver(LifecycleObserver* observer) override;

    /**
     * @brief Most recent phase delivered
     */
    SurfacePhase phase() const { return m_phase; }

private slots:
    void onApplicationStateChanged(Qt::ApplicationState state);
    void onAboutToQuit();

private:
    enum Level { Background = 0, Visible = 1, Foreground = 2 };

    static Level levelFor(Qt::ApplicationState state);
    void moveTo(Level level);
    void replay(LifecycleObserver* observer);
    void dispatch(SurfacePhase phase);

    QList<LifecycleObserver*> m_observers;
    QSet<LifecycleObserver*> m_awaitingReplay;
    Level m_level;
    SurfacePhase m_phase;
    bool m_destroyed;
};

} // namespace HardwareKey
