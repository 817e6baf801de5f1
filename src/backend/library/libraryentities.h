#ifndef LIBRARYENTITIES_H
#define LIBRARYENTITIES_H

#include <QString>
#include <QList>
#include <QDateTime>
#include <optional>

namespace Songbook {

// Codec properties of a single file. A null mimeType or an empty optional means
// the value could not be read.
struct AudioMeta {
    QString mimeType;
    std::optional<int> bitrate;     // bits per second
    std::optional<int> sampleRate;  // Hz

    bool isComplete() const {
        return !mimeType.isEmpty() && bitrate.has_value() && sampleRate.has_value();
    }

    bool isEmpty() const {
        return mimeType.isEmpty() && !bitrate.has_value() && !sampleRate.has_value();
    }

    QString formatName() const;

    bool operator==(const AudioMeta& other) const {
        return mimeType == other.mimeType && bitrate == other.bitrate && sampleRate == other.sampleRate;
    }
    bool operator!=(const AudioMeta& other) const { return !(*this == other); }
};

// One file as reported by the catalog. Only lives for the duration of a sync.
struct RawFileRecord {
    qint64 id = 0;
    QString filePath;
    QString title;
    QString artist;       // raw tag, may name several artists
    QString album;
    QString albumArtist;
    QString genre;
    int year = 0;
    int trackNumber = 0;
    qint64 durationMs = 0;
    qint64 fileSize = 0;
    QDateTime dateModified;

    QString parentDirectory() const;
    QString displayTitle() const;   // title, or the file's base name

    static qint64 stableIdForPath(const QString& filePath);
};

// A catalog record after the optional deep-scan enrichment.
struct ScannedTrack {
    RawFileRecord record;
    std::optional<AudioMeta> audioMeta;
    QString albumArtUri;
};

struct Song {
    qint64 id = 0;
    QString title;
    QString artistName;   // display string as tagged
    qint64 artistId = 0;  // primary artist
    QString albumArtist;
    QString albumName;
    qint64 albumId = 0;
    QString filePath;
    QString parentDirectory;
    qint64 durationMs = 0;
    int trackNumber = 0;
    int year = 0;
    QString genre;
    QString mimeType;
    std::optional<int> bitrate;
    std::optional<int> sampleRate;
    QString albumArtUri;
    qint64 dateModified = 0;  // seconds since epoch

    AudioMeta audioMeta() const { return AudioMeta{mimeType, bitrate, sampleRate}; }

    static constexpr int FieldCount = 18;
};

struct Album {
    qint64 id = 0;
    QString title;
    QString artistName;
    qint64 artistId = 0;
    int year = 0;
    int songCount = 0;
    QString albumArtUri;

    static constexpr int FieldCount = 7;
};

struct Artist {
    qint64 id = 0;
    QString name;

    static constexpr int FieldCount = 2;
};

struct SongArtistCrossRef {
    qint64 songId = 0;
    qint64 artistId = 0;
    bool isPrimary = false;

    bool operator==(const SongArtistCrossRef& other) const {
        return songId == other.songId && artistId == other.artistId;
    }

    static constexpr int FieldCount = 3;
};

struct MergeResult {
    QList<Song> songs;
    QList<Album> albums;
    QList<Artist> artists;
    QList<SongArtistCrossRef> crossRefs;
};

} // namespace Songbook

#endif // LIBRARYENTITIES_H
