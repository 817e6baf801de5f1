#ifndef ALBUMARTCACHE_H
#define ALBUMARTCACHE_H

#include <QMutex>
#include <QSet>
#include <QString>

#include "metadatacache.h"

namespace Songbook {

class AlbumArtStore;
class EmbeddedArtReader;

// Resolves the cover art reference for a song.
//
// Positive results are kept per album id, since the songs of an album nearly
// always share one picture. Songs whose files carry no picture are remembered
// per song id in a separate negative set and skipped until a deep scan asks for
// them again. Neither lock is held while a file is being read.
class AlbumArtCache
{
public:
    static constexpr int DEFAULT_CAPACITY = 200;

    AlbumArtCache(EmbeddedArtReader& reader, AlbumArtStore& store, int capacity = DEFAULT_CAPACITY);

    // Empty string means "no art".
    QString albumArtUri(const QString& filePath, qint64 albumId, qint64 songId, bool deepScan);

    bool isMarkedNoArt(qint64 songId) const;
    void invalidate(qint64 albumId);
    void clear();

    int size() const { return m_cache.size(); }
    int capacity() const { return m_cache.capacity(); }

private:
    void markNoArt(qint64 songId);
    bool takeNoArtMark(qint64 songId);

    EmbeddedArtReader& m_reader;
    AlbumArtStore& m_store;
    MetadataCache<qint64, QString> m_cache;

    mutable QMutex m_noArtMutex;
    mutable QSet<qint64> m_noArt;
};

} // namespace Songbook

#endif // ALBUMARTCACHE_H
