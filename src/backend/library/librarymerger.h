#ifndef LIBRARYMERGER_H
#define LIBRARYMERGER_H

#include <QHash>
#include <QList>
#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include "libraryentities.h"

namespace Songbook {

// Collapses the scanned records of one sync into canonical songs, albums,
// artists and song/artist links.
//
// Artists and albums that already exist in the store keep their ids; new ones
// get ids above the highest stored one. Lookups are case-insensitive, and the
// spelling seen first in the batch becomes the display name.
class LibraryMerger
{
public:
    explicit LibraryMerger(const QStringList& delimiters = QStringList(), bool useDelimiters = true);

    // Artist names contained in a raw artist tag, trimmed, without case-insensitive
    // duplicates. Never empty.
    QStringList splitArtists(const QString& rawArtist) const;

    // Name an album is filed under: the album artist tag, or else the first
    // artist of the artist tag.
    QString albumOwner(const QString& albumArtist, const QString& rawArtist) const;

    MergeResult merge(const QList<ScannedTrack>& tracks,
                      const QList<Artist>& existingArtists = QList<Artist>(),
                      const QList<Album>& existingAlbums = QList<Album>(),
                      const QHash<qint64, Song>& storedSongs = QHash<qint64, Song>()) const;

    // Keeps stored values where the fresh scan could not read one.
    static Song preserveMetadata(const Song& fresh, const Song& stored);

    static QString albumKey(const QString& albumTitle, const QString& albumArtistName);

    static QString unknownArtistName() { return QStringLiteral("Unknown Artist"); }
    static QString unknownAlbumName() { return QStringLiteral("Unknown Album"); }

private:
    QRegularExpression m_separator;
    bool m_useDelimiters;
};

} // namespace Songbook

#endif // LIBRARYMERGER_H
