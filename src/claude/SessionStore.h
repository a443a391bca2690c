/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONSTORE_H
#define SESSIONSTORE_H

#include "SessionRecord.h"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <optional>

namespace Claudemux
{

/**
 * SessionStore persists one SessionRecord per file in a directory.
 *
 * Hook invocations are short-lived processes that write concurrently
 * without any locking. Every save goes through a temporary file in the
 * store directory which is then renamed over <id>.json, so a reader sees
 * either the old or the new record but never a partial one. Two writers
 * racing on the same id resolve as last-writer-wins.
 */
class SessionStore
{
public:
    enum class LoadError {
        None,
        NotFound,
        IoError,
        Corrupt,
    };

    /**
     * Result of resolving a user-supplied id or id prefix
     */
    struct Resolution {
        enum Kind {
            Found,
            NotFound,
            Ambiguous,
        };

        Kind kind = NotFound;
        SessionRecord record;       // Valid when kind == Found
        QStringList candidates;     // Matching ids when kind == Ambiguous
    };

    explicit SessionStore(const QString &directory);

    /**
     * Store rooted at ClaudemuxSettings::storeDirectory()
     */
    static SessionStore fromSettings();

    QString directory() const
    {
        return m_directory;
    }

    /**
     * Path of the record file for @p id
     */
    QString recordPath(const QString &id) const;

    /**
     * Ids must be usable as a file name: letters, digits, '-', '_' and '.',
     * not starting with '.'.
     */
    static bool isValidId(const QString &id);

    /**
     * Atomically write @p record, refreshing its updated timestamp.
     * The timestamp never moves backwards for a given record, and the
     * created timestamp is filled in if missing.
     */
    bool save(SessionRecord &record, QString *errorString = nullptr) const;

    /**
     * Load the record stored under @p id.
     *
     * A file whose only defect is trailing garbage after the JSON object
     * is repaired in place and loads successfully.
     */
    std::optional<SessionRecord> load(const QString &id, LoadError *error = nullptr) const;

    /**
     * All loadable records, sorted by id. Unparsable files are skipped.
     */
    SessionRecordList list() const;

    /**
     * Delete the record file. Returns false if it did not exist or
     * could not be removed.
     */
    bool remove(const QString &id, QString *errorString = nullptr) const;

    /**
     * Resolve an exact id, falling back to a unique id prefix
     */
    Resolution resolve(const QString &idOrPrefix) const;

    /**
     * Extract the first complete top-level JSON object from @p data,
     * ignoring anything after it. Returns an empty array if no complete
     * object is found.
     */
    static QByteArray leadingJsonObject(const QByteArray &data);

private:
    bool writeRaw(const QString &path, const QByteArray &data, QString *errorString) const;

    QString m_directory;
};

} // namespace Claudemux

#endif // SESSIONSTORE_H
