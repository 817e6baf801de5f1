#include "audiopropertiescache.h"
#include "../database/librarystore.h"
#include "../utility/extractionadapters.h"
#include <QDebug>

namespace Songbook {

AudioPropertiesCache::AudioPropertiesCache(LibraryStore& store,
                                           AudioPropertiesReader& fastReader,
                                           AudioPropertiesReader& slowReader,
                                           int capacity)
    : m_store(store)
    , m_fastReader(fastReader)
    , m_slowReader(slowReader)
    , m_cache(capacity)
{
}

AudioMeta AudioPropertiesCache::audioMeta(qint64 songId, const QString& filePath, bool deepScan)
{
    if (std::optional<AudioMeta> cached = m_cache.get(songId)) {
        return *cached;
    }

    if (!deepScan) {
        std::optional<AudioMeta> stored = m_store.getAudioMetadataById(songId);
        if (stored && stored->isComplete()) {
            m_cache.put(songId, *stored);
            return *stored;
        }
    }

    AudioMeta meta = m_fastReader.readProperties(filePath);

    // The slow reader decodes the container, deep scans only
    if ((meta.mimeType.isEmpty() || !meta.sampleRate) && deepScan) {
        qDebug() << "AudioPropertiesCache: Discovering container of" << filePath;
        const AudioMeta discovered = m_slowReader.readProperties(filePath);
        if (meta.mimeType.isEmpty()) {
            meta.mimeType = discovered.mimeType;
        }
        if (!meta.sampleRate) {
            meta.sampleRate = discovered.sampleRate;
        }
        if (!meta.bitrate) {
            meta.bitrate = discovered.bitrate;
        }
    }

    // Cached even when incomplete so unreadable files are read once per process
    m_cache.put(songId, meta);
    return meta;
}

} // namespace Songbook
