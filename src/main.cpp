/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Qt
#include <QCoreApplication>

// KDE
#include <KLocalizedString>

// Claudemux
#include "claude/ClaudemuxSettings.h"
#include "claude/LifecycleController.h"
#include "claude/SessionCommands.h"
#include "claude/SessionStore.h"
#include "claude/TmuxManager.h"

using namespace Claudemux;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("claudemux"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));
    KLocalizedString::setApplicationDomain("claudemux");

    ClaudemuxSettings settings;

    TmuxManager tmux;
    LifecycleController lifecycle(SessionStore::fromSettings(), &tmux, LifecycleController::configFromSettings(&settings));

    SessionCommands commands(&settings, &lifecycle, &tmux);
    return commands.execute(app.arguments());
}
