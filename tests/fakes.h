#ifndef SONGBOOK_TEST_FAKES_H
#define SONGBOOK_TEST_FAKES_H

#include <QBuffer>
#include <QHash>
#include <QImage>
#include <QList>
#include <QMutex>
#include <QMutexLocker>
#include <QSet>
#include <QString>
#include <QThread>
#include <atomic>
#include <optional>
#include <utility>

#include "backend/database/librarystore.h"
#include "backend/library/libraryentities.h"
#include "backend/library/mediacatalog.h"
#include "backend/utility/extractionadapters.h"

namespace SongbookTest {

using namespace Songbook;

// A small PNG that QImageReader accepts.
inline QByteArray validImageBytes(QRgb color = qRgb(200, 40, 40))
{
    QImage image(4, 4, QImage::Format_RGB32);
    image.fill(color);

    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    image.save(&buffer, "PNG");
    return bytes;
}

inline RawFileRecord makeRecord(const QString& filePath,
                                const QString& artist,
                                const QString& album,
                                const QString& title = QString())
{
    RawFileRecord record;
    record.id = RawFileRecord::stableIdForPath(filePath);
    record.filePath = filePath;
    record.title = title;
    record.artist = artist;
    record.album = album;
    record.durationMs = 180000;
    return record;
}

class FakeArtReader : public EmbeddedArtReader
{
public:
    std::optional<EmbeddedPicture> readEmbeddedPicture(const QString& filePath) override
    {
        ++calls;
        QMutexLocker locker(&m_mutex);
        m_paths.append(filePath);
        if (m_pictures.contains(filePath)) {
            return EmbeddedPicture{m_pictures.value(filePath)};
        }
        if (!defaultPicture.isEmpty()) {
            return EmbeddedPicture{defaultPicture};
        }
        return std::nullopt;
    }

    void setPicture(const QString& filePath, const QByteArray& data)
    {
        QMutexLocker locker(&m_mutex);
        m_pictures.insert(filePath, data);
    }

    QStringList paths() const
    {
        QMutexLocker locker(&m_mutex);
        return m_paths;
    }

    QByteArray defaultPicture;
    std::atomic<int> calls{0};

private:
    mutable QMutex m_mutex;
    QHash<QString, QByteArray> m_pictures;
    QStringList m_paths;
};

class FakePropertiesReader : public AudioPropertiesReader
{
public:
    explicit FakePropertiesReader(const AudioMeta& result = AudioMeta())
        : m_result(result)
    {
    }

    AudioMeta readProperties(const QString& filePath) override
    {
        Q_UNUSED(filePath)
        ++calls;
        QMutexLocker locker(&m_mutex);
        return m_result;
    }

    void setResult(const AudioMeta& result)
    {
        QMutexLocker locker(&m_mutex);
        m_result = result;
    }

    std::atomic<int> calls{0};

private:
    QMutex m_mutex;
    AudioMeta m_result;
};

class FakeCatalog : public MediaCatalog
{
public:
    bool enumerate(QList<RawFileRecord>& records, const std::atomic<bool>* cancelFlag = nullptr) override
    {
        Q_UNUSED(cancelFlag)
        ++calls;
        if (failWith.isEmpty()) {
            records = this->records;
            return true;
        }
        m_lastError = failWith;
        return false;
    }

    RawFileRecord readTags(const RawFileRecord& record) const override
    {
        QMutexLocker locker(&m_mutex);
        m_taggedPaths.append(record.filePath);
        return record;
    }

    QString lastError() const override { return m_lastError; }

    QStringList taggedPaths() const
    {
        QMutexLocker locker(&m_mutex);
        return m_taggedPaths;
    }

    void reset()
    {
        QMutexLocker locker(&m_mutex);
        failWith.clear();
        calls = 0;
        m_taggedPaths.clear();
    }

    QList<RawFileRecord> records;
    QString failWith;
    int calls = 0;

private:
    mutable QMutex m_mutex;
    mutable QStringList m_taggedPaths;
    QString m_lastError;
};

// In-memory store. Keeps a copy of its tables when a transaction starts so
// rollbackTransaction() can restore them.
class FakeLibraryStore : public LibraryStore
{
public:
    std::optional<AudioMeta> getAudioMetadataById(qint64 songId) override
    {
        ++audioLookups;
        QMutexLocker locker(&m_mutex);
        auto it = m_tables.songs.constFind(songId);
        if (it == m_tables.songs.constEnd()) {
            return std::nullopt;
        }
        return it->audioMeta();
    }

    std::optional<Song> songById(qint64 songId) override
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_tables.songs.constFind(songId);
        if (it == m_tables.songs.constEnd()) {
            return std::nullopt;
        }
        return *it;
    }

    std::optional<Album> albumById(qint64 albumId) override
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_tables.albums.constFind(albumId);
        if (it == m_tables.albums.constEnd()) {
            return std::nullopt;
        }
        return *it;
    }

    bool songsByIds(const QList<qint64>& songIds, QHash<qint64, Song>& songs) override
    {
        QMutexLocker locker(&m_mutex);
        songs.clear();
        if (!acceptRead("songsByIds")) {
            return false;
        }
        for (qint64 id : songIds) {
            auto it = m_tables.songs.constFind(id);
            if (it != m_tables.songs.constEnd()) {
                songs.insert(id, *it);
            }
        }
        return true;
    }

    bool allArtists(QList<Artist>& artists) override
    {
        QMutexLocker locker(&m_mutex);
        artists.clear();
        if (!acceptRead("allArtists")) {
            return false;
        }
        artists = m_tables.artists.values();
        return true;
    }

    bool allAlbums(QList<Album>& albums) override
    {
        QMutexLocker locker(&m_mutex);
        albums.clear();
        if (!acceptRead("allAlbums")) {
            return false;
        }
        albums = m_tables.albums.values();
        return true;
    }

    bool insertArtists(const QList<Artist>& artists) override
    {
        QMutexLocker locker(&m_mutex);
        if (!acceptChunk(artists.size() * Artist::FieldCount)) {
            return false;
        }
        for (const Artist& artist : artists) {
            m_tables.artists.insert(artist.id, artist);
        }
        return true;
    }

    bool insertAlbums(const QList<Album>& albums) override
    {
        QMutexLocker locker(&m_mutex);
        if (!acceptChunk(albums.size() * Album::FieldCount)) {
            return false;
        }
        for (const Album& album : albums) {
            m_tables.albums.insert(album.id, album);
        }
        return true;
    }

    bool insertSongs(const QList<Song>& songs) override
    {
        QMutexLocker locker(&m_mutex);
        if (failOnInsertSongs) {
            m_lastError = "insertSongs failed";
            return false;
        }
        if (!acceptChunk(songs.size() * Song::FieldCount)) {
            return false;
        }
        for (const Song& song : songs) {
            m_tables.songs.insert(song.id, song);
        }
        return true;
    }

    bool insertCrossRefs(const QList<SongArtistCrossRef>& crossRefs) override
    {
        QMutexLocker locker(&m_mutex);
        if (!acceptChunk(crossRefs.size() * SongArtistCrossRef::FieldCount)) {
            return false;
        }
        for (const SongArtistCrossRef& crossRef : crossRefs) {
            if (!m_tables.crossRefs.contains(crossRef)) {
                m_tables.crossRefs.append(crossRef);
            }
        }
        return true;
    }

    bool deleteSongsExcept(const QList<qint64>& songIds) override
    {
        QMutexLocker locker(&m_mutex);
        const QSet<qint64> keep(songIds.cbegin(), songIds.cend());
        for (auto it = m_tables.songs.begin(); it != m_tables.songs.end();) {
            if (keep.contains(it.key())) {
                ++it;
            } else {
                it = m_tables.songs.erase(it);
            }
        }
        m_tables.crossRefs.removeIf([&keep](const SongArtistCrossRef& crossRef) {
            return !keep.contains(crossRef.songId);
        });
        return true;
    }

    bool deleteAllCrossRefs() override
    {
        QMutexLocker locker(&m_mutex);
        m_tables.crossRefs.clear();
        return true;
    }

    bool deleteOrphans() override
    {
        QMutexLocker locker(&m_mutex);
        QSet<qint64> usedAlbums;
        for (const Song& song : std::as_const(m_tables.songs)) {
            usedAlbums.insert(song.albumId);
        }
        for (auto it = m_tables.albums.begin(); it != m_tables.albums.end();) {
            if (usedAlbums.contains(it.key())) {
                ++it;
            } else {
                it = m_tables.albums.erase(it);
            }
        }

        QSet<qint64> usedArtists;
        for (const SongArtistCrossRef& crossRef : std::as_const(m_tables.crossRefs)) {
            usedArtists.insert(crossRef.artistId);
        }
        for (const Album& album : std::as_const(m_tables.albums)) {
            usedArtists.insert(album.artistId);
        }
        for (auto it = m_tables.artists.begin(); it != m_tables.artists.end();) {
            if (usedArtists.contains(it.key())) {
                ++it;
            } else {
                it = m_tables.artists.erase(it);
            }
        }
        return true;
    }

    bool beginTransaction() override
    {
        QMutexLocker locker(&m_mutex);
        m_snapshot = m_tables;
        m_inTransaction = true;
        ++transactions;
        return true;
    }

    bool commitTransaction() override
    {
        QMutexLocker locker(&m_mutex);
        m_inTransaction = false;
        ++commits;
        return true;
    }

    bool rollbackTransaction() override
    {
        QMutexLocker locker(&m_mutex);
        if (m_inTransaction) {
            m_tables = m_snapshot;
        }
        m_inTransaction = false;
        ++rollbacks;
        return true;
    }

    QString lastError() const override
    {
        QMutexLocker locker(&m_mutex);
        return m_lastError;
    }

    int maxBoundParameters() const override { return parameterLimit; }

    void releaseThreadConnection() override
    {
        QMutexLocker locker(&m_mutex);
        m_releasedOn.append(QThread::currentThread());
    }

    QList<QThread*> releasedOn() const { QMutexLocker locker(&m_mutex); return m_releasedOn; }

    // Seeding and inspection
    void putSong(const Song& song)
    {
        QMutexLocker locker(&m_mutex);
        m_tables.songs.insert(song.id, song);
    }

    QHash<qint64, Song> songs() const { QMutexLocker locker(&m_mutex); return m_tables.songs; }
    QHash<qint64, Album> albums() const { QMutexLocker locker(&m_mutex); return m_tables.albums; }
    QHash<qint64, Artist> artists() const { QMutexLocker locker(&m_mutex); return m_tables.artists; }
    QList<SongArtistCrossRef> crossRefs() const { QMutexLocker locker(&m_mutex); return m_tables.crossRefs; }

    // Largest number of values bound by a single insert call
    int largestChunk() const { QMutexLocker locker(&m_mutex); return m_largestChunk; }

    int parameterLimit = 999;
    bool failOnInsertSongs = false;
    // Bulk reads fail as if the database were locked
    std::atomic<bool> failReads{false};
    std::atomic<int> audioLookups{0};
    int transactions = 0;
    int commits = 0;
    int rollbacks = 0;

private:
    struct Tables {
        QHash<qint64, Song> songs;
        QHash<qint64, Album> albums;
        QHash<qint64, Artist> artists;
        QList<SongArtistCrossRef> crossRefs;
    };

    bool acceptChunk(int boundValues)
    {
        m_largestChunk = qMax(m_largestChunk, boundValues);
        if (boundValues > parameterLimit) {
            m_lastError = QString("%1 bound values exceed the limit of %2").arg(boundValues).arg(parameterLimit);
            return false;
        }
        return true;
    }

    bool acceptRead(const char *operation)
    {
        if (failReads) {
            m_lastError = QString("%1: database is locked").arg(QLatin1String(operation));
            return false;
        }
        return true;
    }

    mutable QMutex m_mutex;
    Tables m_tables;
    Tables m_snapshot;
    bool m_inTransaction = false;
    int m_largestChunk = 0;
    QString m_lastError;
    QList<QThread*> m_releasedOn;
};

} // namespace SongbookTest

#endif // SONGBOOK_TEST_FAKES_H
