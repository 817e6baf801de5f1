#ifndef LIBRARYSTORE_H
#define LIBRARYSTORE_H

#include <QHash>
#include <QList>
#include <QString>
#include <optional>

#include "../library/libraryentities.h"

namespace Songbook {

// Persistent home of the synced library.
//
// Writes are batched; a single insert call must not bind more than
// maxBoundParameters() values, so callers split large batches using the
// entity's FieldCount. The store serialises its own writes. Methods that read
// may be called from scan workers.
class LibraryStore
{
public:
    virtual ~LibraryStore() = default;

    // Previously persisted codec properties, or nullopt when the song is unknown.
    virtual std::optional<AudioMeta> getAudioMetadataById(qint64 songId) = 0;

    virtual std::optional<Song> songById(qint64 songId) = 0;
    virtual std::optional<Album> albumById(qint64 albumId) = 0;

    // Bulk reads return false when the store could not be queried; the output
    // is only complete when they return true.
    virtual bool songsByIds(const QList<qint64>& songIds, QHash<qint64, Song>& songs) = 0;
    virtual bool allArtists(QList<Artist>& artists) = 0;
    virtual bool allAlbums(QList<Album>& albums) = 0;

    virtual bool insertArtists(const QList<Artist>& artists) = 0;
    virtual bool insertAlbums(const QList<Album>& albums) = 0;
    virtual bool insertSongs(const QList<Song>& songs) = 0;
    virtual bool insertCrossRefs(const QList<SongArtistCrossRef>& crossRefs) = 0;

    // Removes every song whose id is not in |songIds|.
    virtual bool deleteSongsExcept(const QList<qint64>& songIds) = 0;
    virtual bool deleteAllCrossRefs() = 0;
    // Removes albums without songs and artists without songs or albums.
    virtual bool deleteOrphans() = 0;

    virtual bool beginTransaction() = 0;
    virtual bool commitTransaction() = 0;
    virtual bool rollbackTransaction() = 0;

    virtual QString lastError() const = 0;

    // Drops whatever the calling thread holds open in the store. Called by a
    // worker thread once it is done with the store.
    virtual void releaseThreadConnection() {}

    // SQLITE_MAX_VARIABLE_NUMBER of older SQLite builds
    virtual int maxBoundParameters() const { return 999; }
};

} // namespace Songbook

#endif // LIBRARYSTORE_H
