#ifndef DIRECTORYRULES_H
#define DIRECTORYRULES_H

#include <QString>
#include <QStringList>

namespace Songbook {

// Decides whether files in a directory take part in a sync.
//
// A directory is rejected when it lies under a blocked prefix, unless an allowed
// prefix that is strictly deeper than that blocked prefix also contains it.
// When the allowed list is non-empty the resolver runs in allow-list mode and a
// directory must lie under one of the allowed prefixes. Otherwise everything not
// blocked is accepted.
//
// Prefixes match whole path components: "/music/live" covers "/music/live" and
// "/music/live/2019" but not "/music/lively".
class DirectoryRules
{
public:
    DirectoryRules() = default;
    DirectoryRules(const QStringList& blocked, const QStringList& allowed);

    bool isAllowed(const QString& normalizedParentPath) const;

    bool isEmpty() const { return m_blocked.isEmpty() && m_allowed.isEmpty(); }
    bool isAllowListMode() const { return !m_allowed.isEmpty(); }
    QStringList blocked() const { return m_blocked; }
    QStringList allowed() const { return m_allowed; }

    static QString normalizePath(const QString& path);

private:
    // Length of the longest prefix in |prefixes| covering |path|, or -1.
    static int longestMatch(const QStringList& prefixes, const QString& path);
    static bool isUnder(const QString& path, const QString& prefix);
    static QStringList normalizeAll(const QStringList& paths);

    QStringList m_blocked;
    QStringList m_allowed;
};

} // namespace Songbook

#endif // DIRECTORYRULES_H
