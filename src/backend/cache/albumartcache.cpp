#include "albumartcache.h"
#include "albumartstore.h"
#include "../utility/extractionadapters.h"
#include <QDebug>
#include <QMutexLocker>

namespace Songbook {

AlbumArtCache::AlbumArtCache(EmbeddedArtReader& reader, AlbumArtStore& store, int capacity)
    : m_reader(reader)
    , m_store(store)
    , m_cache(capacity)
{
}

QString AlbumArtCache::albumArtUri(const QString& filePath, qint64 albumId, qint64 songId, bool deepScan)
{
    // Songs of one album share the picture
    if (std::optional<QString> cached = m_cache.get(albumId)) {
        return *cached;
    }

    if (!deepScan) {
        const QString persisted = m_store.referenceFor(songId);
        if (!persisted.isEmpty()) {
            m_cache.put(albumId, persisted);
            return persisted;
        }
    }

    if (isMarkedNoArt(songId)) {
        if (!deepScan) {
            return QString();
        }
        // Deep scan re-checks files previously found without art
        takeNoArtMark(songId);
    }

    std::optional<EmbeddedPicture> picture = m_reader.readEmbeddedPicture(filePath);
    if (picture && !picture->data.isEmpty()) {
        const QString reference = m_store.save(picture->data, songId);
        if (!reference.isEmpty()) {
            // A stale marker must never outlive a successful extraction
            takeNoArtMark(songId);
            m_cache.put(albumId, reference);
            return reference;
        }
    }

    markNoArt(songId);
    return QString();
}

bool AlbumArtCache::isMarkedNoArt(qint64 songId) const
{
    {
        QMutexLocker locker(&m_noArtMutex);
        if (m_noArt.contains(songId)) {
            return true;
        }
    }

    // Marker left behind by an earlier process
    if (m_store.hasNoArtMarker(songId)) {
        QMutexLocker locker(&m_noArtMutex);
        m_noArt.insert(songId);
        return true;
    }
    return false;
}

void AlbumArtCache::markNoArt(qint64 songId)
{
    {
        QMutexLocker locker(&m_noArtMutex);
        m_noArt.insert(songId);
    }
    m_store.markNoArt(songId);
}

bool AlbumArtCache::takeNoArtMark(qint64 songId)
{
    bool wasMarked = false;
    {
        QMutexLocker locker(&m_noArtMutex);
        wasMarked = m_noArt.remove(songId);
    }
    if (!m_store.clearNoArtMarker(songId)) {
        qWarning() << "AlbumArtCache: Marker for song" << songId << "could not be removed";
    }
    return wasMarked;
}

void AlbumArtCache::invalidate(qint64 albumId)
{
    m_cache.remove(albumId);
}

void AlbumArtCache::clear()
{
    m_cache.clear();
    QMutexLocker locker(&m_noArtMutex);
    m_noArt.clear();
}

} // namespace Songbook
