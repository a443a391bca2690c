/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SignalForwarder.h"

#include "ClaudemuxDebug.h"

#include <QHash>
#include <QSocketNotifier>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace Claudemux
{

namespace
{
int s_pipe[2] = {-1, -1};
QHash<int, struct sigaction> s_previousHandlers;

void writeSignalToPipe(int signalNumber)
{
    const int savedErrno = errno;
    const unsigned char byte = static_cast<unsigned char>(signalNumber);
    if (s_pipe[1] >= 0) {
        // Nothing useful can be done about a full pipe inside a handler
        [[maybe_unused]] const ssize_t written = ::write(s_pipe[1], &byte, 1);
    }
    errno = savedErrno;
}
}

QList<int> SignalForwarder::attachSignals()
{
    return {SIGINT, SIGTERM, SIGHUP, SIGWINCH};
}

SignalForwarder::SignalForwarder(const QList<int> &signalNumbers, QObject *parent)
    : QObject(parent)
{
    if (s_pipe[0] >= 0) {
        qCWarning(ClaudemuxLifecycle) << "SignalForwarder: Another forwarder is already active";
        return;
    }

    if (::pipe(s_pipe) != 0) {
        qCWarning(ClaudemuxLifecycle) << "SignalForwarder: pipe() failed:" << std::strerror(errno);
        s_pipe[0] = s_pipe[1] = -1;
        return;
    }
    for (int fd : s_pipe) {
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }

    m_notifier = new QSocketNotifier(s_pipe[0], QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &SignalForwarder::readPipe);

    for (int signalNumber : signalNumbers) {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = writeSignalToPipe;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = SA_RESTART;

        struct sigaction previous;
        if (sigaction(signalNumber, &sa, &previous) == -1) {
            qCWarning(ClaudemuxLifecycle) << "SignalForwarder: Failed to install handler for signal" << signalNumber;
            continue;
        }
        s_previousHandlers.insert(signalNumber, previous);
        m_signals.append(signalNumber);
    }

    m_active = true;
}

SignalForwarder::~SignalForwarder()
{
    if (!m_active) {
        return;
    }

    for (int signalNumber : std::as_const(m_signals)) {
        const struct sigaction previous = s_previousHandlers.take(signalNumber);
        sigaction(signalNumber, &previous, nullptr);
    }

    delete m_notifier;
    m_notifier = nullptr;
    ::close(s_pipe[0]);
    ::close(s_pipe[1]);
    s_pipe[0] = s_pipe[1] = -1;
}

void SignalForwarder::readPipe()
{
    unsigned char byte = 0;
    while (::read(s_pipe[0], &byte, 1) == 1) {
        qCDebug(ClaudemuxLifecycle) << "SignalForwarder: Received signal" << byte;
        Q_EMIT signalReceived(byte);
    }
}

} // namespace Claudemux

#include "moc_SignalForwarder.cpp"
