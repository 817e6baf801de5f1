#include "librarymerger.h"
#include <QDebug>
#include <QPair>
#include <QSet>

namespace Songbook {

namespace {

// Running name -> Artist assignment for one merge pass
class ArtistRegistry
{
public:
    ArtistRegistry(const QList<Artist>& existing, qsizetype estimatedNewArtists)
    {
        m_stored.reserve(existing.size());
        for (const Artist& artist : existing) {
            const QString key = artist.name.toCaseFolded();
            if (!m_stored.contains(key)) {
                m_stored.insert(key, artist.id);
            }
            m_nextId = qMax(m_nextId, artist.id + 1);
        }
        m_assigned.reserve(estimatedNewArtists);
    }

    qint64 idFor(const QString& name)
    {
        const QString key = name.toCaseFolded();
        auto it = m_assigned.constFind(key);
        if (it != m_assigned.constEnd()) {
            return it.value();
        }

        const qint64 id = m_stored.value(key, 0) > 0 ? m_stored.value(key) : m_nextId++;
        m_assigned.insert(key, id);
        m_artists.append(Artist{id, name});
        return id;
    }

    QList<Artist> artists() const { return m_artists; }

private:
    QHash<QString, qint64> m_stored;
    QHash<QString, qint64> m_assigned;
    QList<Artist> m_artists;
    qint64 m_nextId = 1;
};

} // namespace

LibraryMerger::LibraryMerger(const QStringList& delimiters, bool useDelimiters)
    : m_useDelimiters(useDelimiters)
{
    QStringList escaped;
    for (const QString& delimiter : delimiters) {
        const QString trimmed = delimiter.trimmed();
        if (!trimmed.isEmpty()) {
            escaped.append(QRegularExpression::escape(trimmed));
        }
    }

    if (escaped.isEmpty()) {
        m_useDelimiters = false;
    } else {
        m_separator = QRegularExpression(escaped.join('|'));
    }
}

QStringList LibraryMerger::splitArtists(const QString& rawArtist) const
{
    const QStringList parts = m_useDelimiters
        ? rawArtist.split(m_separator, Qt::SkipEmptyParts)
        : QStringList{rawArtist};

    QStringList names;
    QSet<QString> seen;
    for (const QString& part : parts) {
        const QString name = part.simplified();
        if (name.isEmpty()) {
            continue;
        }
        const QString key = name.toCaseFolded();
        if (seen.contains(key)) {
            continue;
        }
        seen.insert(key);
        names.append(name);
    }

    if (names.isEmpty()) {
        names.append(unknownArtistName());
    }
    return names;
}

QString LibraryMerger::albumOwner(const QString& albumArtist, const QString& rawArtist) const
{
    const QString owner = albumArtist.simplified();
    return owner.isEmpty() ? splitArtists(rawArtist).first() : owner;
}

QString LibraryMerger::albumKey(const QString& albumTitle, const QString& albumArtistName)
{
    return albumTitle.simplified().toCaseFolded() + QChar(0x1f) + albumArtistName.simplified().toCaseFolded();
}

Song LibraryMerger::preserveMetadata(const Song& fresh, const Song& stored)
{
    Song merged = fresh;
    if (merged.mimeType.isEmpty()) {
        merged.mimeType = stored.mimeType;
    }
    if (!merged.bitrate) {
        merged.bitrate = stored.bitrate;
    }
    if (!merged.sampleRate) {
        merged.sampleRate = stored.sampleRate;
    }
    if (merged.albumArtUri.isEmpty()) {
        merged.albumArtUri = stored.albumArtUri;
    }
    if (merged.durationMs <= 0) {
        merged.durationMs = stored.durationMs;
    }
    return merged;
}

MergeResult LibraryMerger::merge(const QList<ScannedTrack>& tracks,
                                 const QList<Artist>& existingArtists,
                                 const QList<Album>& existingAlbums,
                                 const QHash<qint64, Song>& storedSongs) const
{
    MergeResult result;

    // Libraries average several songs per artist
    ArtistRegistry artists(existingArtists, qMax<qsizetype>(16, tracks.size() / 4));

    QHash<QString, qint64> storedAlbumIds;
    qint64 nextAlbumId = 1;
    storedAlbumIds.reserve(existingAlbums.size());
    for (const Album& album : existingAlbums) {
        const QString key = albumKey(album.title, album.artistName);
        if (!storedAlbumIds.contains(key)) {
            storedAlbumIds.insert(key, album.id);
        }
        nextAlbumId = qMax(nextAlbumId, album.id + 1);
    }

    QHash<QString, int> albumIndexByKey;
    QSet<qint64> seenSongs;
    QSet<QPair<qint64, qint64>> seenCrossRefs;

    result.songs.reserve(tracks.size());
    result.crossRefs.reserve(tracks.size());

    for (const ScannedTrack& track : tracks) {
        const RawFileRecord& record = track.record;
        if (seenSongs.contains(record.id)) {
            // Same file reached through overlapping music folders
            continue;
        }
        seenSongs.insert(record.id);

        const QStringList artistNames = splitArtists(record.artist);
        QList<qint64> artistIds;
        artistIds.reserve(artistNames.size());
        for (const QString& name : artistNames) {
            artistIds.append(artists.idFor(name));
        }

        const QString albumArtistName = albumOwner(record.albumArtist, record.artist);
        const QString albumTitle = record.album.simplified().isEmpty()
            ? unknownAlbumName()
            : record.album.simplified();

        const QString key = albumKey(albumTitle, albumArtistName);
        int albumIndex = albumIndexByKey.value(key, -1);
        if (albumIndex < 0) {
            Album album;
            album.id = storedAlbumIds.value(key, 0) > 0 ? storedAlbumIds.value(key) : nextAlbumId++;
            album.title = albumTitle;
            album.artistName = albumArtistName;
            album.artistId = artists.idFor(albumArtistName);
            albumIndex = result.albums.size();
            albumIndexByKey.insert(key, albumIndex);
            result.albums.append(album);
        }

        Song song;
        song.id = record.id;
        song.title = record.displayTitle();
        song.artistName = record.artist.simplified().isEmpty() ? artistNames.first() : record.artist.simplified();
        song.artistId = artistIds.first();
        song.albumArtist = record.albumArtist.simplified();
        song.albumName = albumTitle;
        song.albumId = result.albums.at(albumIndex).id;
        song.filePath = record.filePath;
        song.parentDirectory = record.parentDirectory();
        song.durationMs = record.durationMs;
        song.trackNumber = record.trackNumber;
        song.year = record.year;
        song.genre = record.genre.trimmed();
        if (track.audioMeta) {
            song.mimeType = track.audioMeta->mimeType;
            song.bitrate = track.audioMeta->bitrate;
            song.sampleRate = track.audioMeta->sampleRate;
        }
        song.albumArtUri = track.albumArtUri;
        song.dateModified = record.dateModified.isValid() ? record.dateModified.toSecsSinceEpoch() : 0;

        auto stored = storedSongs.constFind(song.id);
        if (stored != storedSongs.constEnd()) {
            song = preserveMetadata(song, stored.value());
        }

        Album& album = result.albums[albumIndex];
        album.songCount++;
        if (album.year == 0 && song.year > 0) {
            album.year = song.year;
        }
        if (album.albumArtUri.isEmpty() && !song.albumArtUri.isEmpty()) {
            album.albumArtUri = song.albumArtUri;
        }

        for (int i = 0; i < artistIds.size(); ++i) {
            const QPair<qint64, qint64> pair(song.id, artistIds.at(i));
            if (seenCrossRefs.contains(pair)) {
                continue;
            }
            seenCrossRefs.insert(pair);
            result.crossRefs.append(SongArtistCrossRef{song.id, artistIds.at(i), i == 0});
        }

        result.songs.append(song);
    }

    result.artists = artists.artists();

    qDebug() << "LibraryMerger: Merged" << tracks.size() << "records into" << result.songs.size() << "songs,"
             << result.albums.size() << "albums," << result.artists.size() << "artists,"
             << result.crossRefs.size() << "cross references";
    return result;
}

} // namespace Songbook
