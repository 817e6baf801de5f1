#ifndef AUDIOPROPERTIESCACHE_H
#define AUDIOPROPERTIESCACHE_H

#include <QString>

#include "metadatacache.h"
#include "../library/libraryentities.h"

namespace Songbook {

class LibraryStore;
class AudioPropertiesReader;

// Codec properties per song id, resolved from memory, then from the store, then
// from the file itself.
class AudioPropertiesCache
{
public:
    static constexpr int DEFAULT_CAPACITY = 1000;

    AudioPropertiesCache(LibraryStore& store,
                         AudioPropertiesReader& fastReader,
                         AudioPropertiesReader& slowReader,
                         int capacity = DEFAULT_CAPACITY);

    AudioMeta audioMeta(qint64 songId, const QString& filePath, bool deepScan);

    void invalidate(qint64 songId) { m_cache.remove(songId); }
    void clear() { m_cache.clear(); }
    int size() const { return m_cache.size(); }
    int capacity() const { return m_cache.capacity(); }

private:
    LibraryStore& m_store;
    AudioPropertiesReader& m_fastReader;
    AudioPropertiesReader& m_slowReader;
    MetadataCache<qint64, AudioMeta> m_cache;
};

} // namespace Songbook

#endif // AUDIOPROPERTIESCACHE_H
