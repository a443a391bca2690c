/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionStore.h"

#include "ClaudemuxDebug.h"
#include "ClaudemuxSettings.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QSaveFile>

namespace Claudemux
{

SessionStore::SessionStore(const QString &directory)
    : m_directory(directory)
{
}

SessionStore SessionStore::fromSettings()
{
    if (auto *settings = ClaudemuxSettings::instance()) {
        return SessionStore(settings->storeDirectory());
    }
    return SessionStore(ClaudemuxSettings::dataDirectory() + QStringLiteral("/sessions"));
}

QString SessionStore::recordPath(const QString &id) const
{
    return m_directory + QLatin1Char('/') + id + QStringLiteral(".json");
}

bool SessionStore::isValidId(const QString &id)
{
    static const QRegularExpression pattern(QStringLiteral("^[A-Za-z0-9_-][A-Za-z0-9._-]*$"));
    return pattern.match(id).hasMatch();
}

bool SessionStore::writeRaw(const QString &path, const QByteArray &data, QString *errorString) const
{
    if (!QDir().mkpath(m_directory)) {
        if (errorString) {
            *errorString = QStringLiteral("cannot create store directory %1").arg(m_directory);
        }
        return false;
    }

    // QSaveFile writes next to the target and renames on commit()
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorString) {
            *errorString = file.errorString();
        }
        return false;
    }

    if (file.write(data) != data.size()) {
        if (errorString) {
            *errorString = file.errorString();
        }
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        if (errorString) {
            *errorString = file.errorString();
        }
        return false;
    }
    return true;
}

bool SessionStore::save(SessionRecord &record, QString *errorString) const
{
    if (!isValidId(record.id)) {
        if (errorString) {
            *errorString = QStringLiteral("invalid session id '%1'").arg(record.id);
        }
        return false;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    if (!record.created.isValid()) {
        record.created = now;
    }
    if (!record.updated.isValid() || record.updated < now) {
        record.updated = now;
    }

    const QByteArray data = QJsonDocument(record.toJson()).toJson(QJsonDocument::Indented);
    QString error;
    if (!writeRaw(recordPath(record.id), data, &error)) {
        qCWarning(ClaudemuxStore) << "SessionStore: Failed to save session" << record.id << ":" << error;
        if (errorString) {
            *errorString = error;
        }
        return false;
    }
    return true;
}

QByteArray SessionStore::leadingJsonObject(const QByteArray &data)
{
    int start = 0;
    while (start < data.size() && QChar::isSpace(static_cast<uchar>(data.at(start)))) {
        ++start;
    }
    if (start >= data.size() || data.at(start) != '{') {
        return QByteArray();
    }

    int depth = 0;
    bool inString = false;
    bool escaped = false;
    for (int i = start; i < data.size(); ++i) {
        const char c = data.at(i);
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }

        if (c == '"') {
            inString = true;
        } else if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
            if (depth == 0) {
                return data.mid(start, i - start + 1);
            }
        }
    }
    return QByteArray();
}

std::optional<SessionRecord> SessionStore::load(const QString &id, LoadError *error) const
{
    auto fail = [error](LoadError reason) -> std::optional<SessionRecord> {
        if (error) {
            *error = reason;
        }
        return std::nullopt;
    };

    if (!isValidId(id)) {
        return fail(LoadError::NotFound);
    }

    const QString path = recordPath(id);
    QFile file(path);
    if (!file.exists()) {
        return fail(LoadError::NotFound);
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(ClaudemuxStore) << "SessionStore: Cannot read" << path << ":" << file.errorString();
        return fail(LoadError::IoError);
    }
    const QByteArray raw = file.readAll();
    file.close();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(raw, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        // Historical non-atomic writes could leave the tail of a longer
        // previous record behind the current one
        const QByteArray head = leadingJsonObject(raw);
        QJsonParseError retryError;
        doc = head.isEmpty() ? QJsonDocument() : QJsonDocument::fromJson(head, &retryError);
        if (head.isEmpty() || retryError.error != QJsonParseError::NoError || !doc.isObject()) {
            qCWarning(ClaudemuxStore) << "SessionStore: Corrupt session file" << path << ":" << parseError.errorString()
                                      << "raw content:" << raw.left(1024);
            return fail(LoadError::Corrupt);
        }

        QString repairError;
        if (writeRaw(path, head + '\n', &repairError)) {
            qCInfo(ClaudemuxStore) << "SessionStore: Repaired session file" << path << "- dropped" << (raw.size() - head.size()) << "trailing bytes";
        } else {
            qCWarning(ClaudemuxStore) << "SessionStore: Could not repair" << path << ":" << repairError;
        }
    }

    if (!doc.isObject()) {
        qCWarning(ClaudemuxStore) << "SessionStore: Session file is not a JSON object:" << path << "raw content:" << raw.left(1024);
        return fail(LoadError::Corrupt);
    }

    SessionRecord record = SessionRecord::fromJson(doc.object());
    if (record.id.isEmpty()) {
        record.id = id;
    }
    if (error) {
        *error = LoadError::None;
    }
    return record;
}

SessionRecordList SessionStore::list() const
{
    SessionRecordList records;

    QDir dir(m_directory);
    if (!dir.exists()) {
        return records;
    }

    const QStringList files = dir.entryList({QStringLiteral("*.json")}, QDir::Files, QDir::Name);
    for (const QString &fileName : files) {
        const QString id = QFileInfo(fileName).completeBaseName();
        LoadError error = LoadError::None;
        auto record = load(id, &error);
        if (record) {
            records.append(*record);
        }
    }
    return records;
}

bool SessionStore::remove(const QString &id, QString *errorString) const
{
    if (!isValidId(id)) {
        if (errorString) {
            *errorString = QStringLiteral("invalid session id '%1'").arg(id);
        }
        return false;
    }

    QFile file(recordPath(id));
    if (!file.exists()) {
        if (errorString) {
            *errorString = QStringLiteral("session %1 not found").arg(id);
        }
        return false;
    }
    if (!file.remove()) {
        qCWarning(ClaudemuxStore) << "SessionStore: Failed to delete" << file.fileName() << ":" << file.errorString();
        if (errorString) {
            *errorString = file.errorString();
        }
        return false;
    }
    return true;
}

SessionStore::Resolution SessionStore::resolve(const QString &idOrPrefix) const
{
    Resolution resolution;
    if (idOrPrefix.isEmpty()) {
        return resolution;
    }

    if (auto exact = load(idOrPrefix)) {
        resolution.kind = Resolution::Found;
        resolution.record = *exact;
        return resolution;
    }

    SessionRecordList matches;
    const SessionRecordList all = list();
    for (const SessionRecord &record : all) {
        if (record.id.startsWith(idOrPrefix)) {
            matches.append(record);
        }
    }

    if (matches.size() == 1) {
        resolution.kind = Resolution::Found;
        resolution.record = matches.first();
    } else if (matches.size() > 1) {
        resolution.kind = Resolution::Ambiguous;
        for (const SessionRecord &record : std::as_const(matches)) {
            resolution.candidates.append(record.id);
        }
    }
    return resolution;
}

} // namespace Claudemux
