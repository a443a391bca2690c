/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SIGNALFORWARDER_H
#define SIGNALFORWARDER_H

#include <QList>
#include <QObject>

class QSocketNotifier;

namespace Claudemux
{

/**
 * SignalForwarder turns POSIX signals into a Qt signal.
 *
 * The handler only writes the signal number into a pipe; a
 * QSocketNotifier picks it up in the event loop. Previous handlers are
 * restored when the forwarder is destroyed. Only one forwarder may be
 * active at a time.
 */
class SignalForwarder : public QObject
{
    Q_OBJECT

public:
    /**
     * Signals forwarded to an attached tmux client
     */
    static QList<int> attachSignals();

    explicit SignalForwarder(const QList<int> &signalNumbers, QObject *parent = nullptr);
    ~SignalForwarder() override;

    bool isActive() const
    {
        return m_active;
    }

Q_SIGNALS:
    void signalReceived(int signalNumber);

private:
    void readPipe();

    QList<int> m_signals;
    QSocketNotifier *m_notifier = nullptr;
    bool m_active = false;
};

} // namespace Claudemux

#endif // SIGNALFORWARDER_H
