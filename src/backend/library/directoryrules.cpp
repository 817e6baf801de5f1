#include "directoryrules.h"
#include <QDir>
#include <QSet>

namespace Songbook {

DirectoryRules::DirectoryRules(const QStringList& blocked, const QStringList& allowed)
    : m_blocked(normalizeAll(blocked))
    , m_allowed(normalizeAll(allowed))
{
}

bool DirectoryRules::isAllowed(const QString& normalizedParentPath) const
{
    const QString path = normalizePath(normalizedParentPath);

    const int blockedLength = longestMatch(m_blocked, path);
    const int allowedLength = longestMatch(m_allowed, path);

    if (blockedLength >= 0 && allowedLength <= blockedLength) {
        return false;
    }

    if (!m_allowed.isEmpty() && allowedLength < 0) {
        return false;
    }

    return true;
}

QString DirectoryRules::normalizePath(const QString& path)
{
    QString cleaned = QDir::cleanPath(path.trimmed());
    while (cleaned.length() > 1 && cleaned.endsWith('/')) {
        cleaned.chop(1);
    }
    return cleaned;
}

int DirectoryRules::longestMatch(const QStringList& prefixes, const QString& path)
{
    int best = -1;
    for (const QString& prefix : prefixes) {
        if (prefix.length() > best && isUnder(path, prefix)) {
            best = prefix.length();
        }
    }
    return best;
}

bool DirectoryRules::isUnder(const QString& path, const QString& prefix)
{
    if (!path.startsWith(prefix)) {
        return false;
    }
    if (path.length() == prefix.length() || prefix == "/") {
        return true;
    }
    return path.at(prefix.length()) == '/';
}

QStringList DirectoryRules::normalizeAll(const QStringList& paths)
{
    QStringList result;
    QSet<QString> seen;
    for (const QString& path : paths) {
        if (path.trimmed().isEmpty()) {
            continue;
        }
        const QString normalized = normalizePath(path);
        if (!seen.contains(normalized)) {
            seen.insert(normalized);
            result.append(normalized);
        }
    }
    return result;
}

} // namespace Songbook
