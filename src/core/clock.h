#pragma once
#include <QDateTime>
#include <QThread>

class Clock {
public:
    virtual ~Clock() = default;
    virtual qint64 nowMs() const = 0;
    // Blocks the calling worker thread.
    virtual void sleepFor(qint64 ms) const = 0;
};

class SystemClock : public Clock {
public:
    qint64 nowMs() const override { return QDateTime::currentMSecsSinceEpoch(); }
    void sleepFor(qint64 ms) const override
    {
        if (ms > 0)
            QThread::msleep(static_cast<unsigned long>(ms));
    }
};
