// Copyright (C) 2025 Status Research & Development GmbH
// SPDX-License-Identifier: MIT

#include "hardware-key-qt/backends/application_lifecycle_source.h"
#include <QCoreApplication>
#include <QDebug>
#include <QGuiApplication>
#include <QTimer>

namespace HardwareKey {

ApplicationLifecycleSource::ApplicationLifecycleSource(QObject* parent)
    : LifecycleSource(parent)
    , m_level(Foreground)
    , m_phase(SurfacePhase::Created)
    , m_destroyed(false)
{
    auto* app = QCoreApplication::instance();
    auto* guiApp = qobject_cast<QGuiApplication*>(app);

    if (guiApp) {
        m_level = levelFor(guiApp->applicationState());
        connect(guiApp, &QGuiApplication::applicationStateChanged,
                this, &ApplicationLifecycleSource::onApplicationStateChanged);
        qDebug() << "ApplicationLifecycleSource: Initial app state=" << static_cast<int>(guiApp->applicationState());
    } else {
        qDebug() << "ApplicationLifecycleSource: No QGuiApplication, surface is always resumed";
    }

    if (app) {
        connect(app, &QCoreApplication::aboutToQuit,
                this, &ApplicationLifecycleSource::onAboutToQuit);
    }

    switch (m_level) {
        case Background: m_phase = SurfacePhase::Stopped; break;
        case Visible: m_phase = SurfacePhase::Started; break;
        case Foreground: m_phase = SurfacePhase::Resumed; break;
    }
}

ApplicationLifecycleSource::~ApplicationLifecycleSource()
{
    onAboutToQuit();
}

bool ApplicationLifecycleSource::registerObserver(LifecycleObserver* observer)
{
    if (!observer || m_observers.contains(observer)) {
        return false;
    }

    m_observers.append(observer);
    if (m_destroyed) {
        return true;
    }

    // Events before the replay runs would arrive out of order
    m_awaitingReplay.insert(observer);
    QTimer::singleShot(0, this, [this, observer]() {
        replay(observer);
    });
    return true;
}

bool ApplicationLifecycleSource::unregisterObserver(LifecycleObserver* observer)
{
    m_awaitingReplay.remove(observer);
    return m_observers.removeOne(observer);
}

void ApplicationLifecycleSource::onApplicationStateChanged(Qt::ApplicationState state)
{
    qDebug() << "ApplicationLifecycleSource: App state changed=" << static_cast<int>(state);
    moveTo(levelFor(state));
}

void ApplicationLifecycleSource::onAboutToQuit()
{
    if (m_destroyed) {
        return;
    }
    moveTo(Background);
    m_destroyed = true;
    dispatch(SurfacePhase::Destroyed);
}

ApplicationLifecycleSource::Level ApplicationLifecycleSource::levelFor(Qt::ApplicationState state)
{
    switch (state) {
        case Qt::ApplicationActive:
            return Foreground;
        case Qt::ApplicationInactive:
            return Visible;
        case Qt::ApplicationHidden:
        case Qt::ApplicationSuspended:
            return Background;
    }
    return Background;
}

void ApplicationLifecycleSource::moveTo(Level level)
{
    if (m_destroyed) {
        return;
    }

    while (m_level < level) {
        m_level = static_cast<Level>(m_level + 1);
        dispatch(m_level == Visible ? SurfacePhase::Started : SurfacePhase::Resumed);
    }
    while (m_level > level) {
        m_level = static_cast<Level>(m_level - 1);
        dispatch(m_level == Visible ? SurfacePhase::Paused : SurfacePhase::Stopped);
    }
}

void ApplicationLifecycleSource::replay(LifecycleObserver* observer)
{
    if (!m_awaitingReplay.remove(observer)) {
        return;  // unregistered in the meantime
    }

    observer->onLifecycleEvent(SurfacePhase::Created);
    if (m_level >= Visible && m_observers.contains(observer)) {
        observer->onLifecycleEvent(SurfacePhase::Started);
    }
    if (m_level >= Foreground && m_observers.contains(observer)) {
        observer->onLifecycleEvent(SurfacePhase::Resumed);
    }
}

void ApplicationLifecycleSource::dispatch(SurfacePhase phase)
{
    m_phase = phase;
    if (phase == SurfacePhase::Destroyed) {
        m_awaitingReplay.clear();
    }

    // Observers may unregister while being notified
    const QList<LifecycleObserver*> observers = m_observers;
    for (LifecycleObserver* observer : observers) {
        if (!m_observers.contains(observer) || m_awaitingReplay.contains(observer)) {
            continue;
        }
        observer->onLifecycleEvent(phase);
    }
}

} // namespace HardwareKey
