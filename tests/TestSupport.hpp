#pragma once
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <functional>

// Runs the event loop until pred() holds or timeoutMs elapses.
inline bool WaitUntil(const std::function<bool()>& pred, int timeoutMs = 5000) {
    QElapsedTimer timer;
    timer.start();
    while (!pred()) {
        if (timer.elapsed() > timeoutMs) return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
    }
    return true;
}

// Lets already-posted events run without waiting for anything in particular.
inline void Drain(int rounds = 20) {
    for (int i = 0; i < rounds; ++i) QCoreApplication::processEvents(QEventLoop::AllEvents);
}

// Controllable wall clock in milliseconds.
struct ManualClock {
    qint64 nowMs = 1'700'000'000'000;

    std::function<qint64()> fn() {
        return [this] { return nowMs; };
    }
    void advanceSeconds(qint64 s) { nowMs += s * 1000; }
};
