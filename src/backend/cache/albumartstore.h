#ifndef ALBUMARTSTORE_H
#define ALBUMARTSTORE_H

#include <QString>
#include <QByteArray>

namespace Songbook {

// On-disk home of extracted cover art. One file per song, plus an empty
// "_no" marker for songs known to carry no picture, so that a later process can
// skip them without opening the audio file again.
//
// References handed out are file:// URLs. Safe to use from several threads as
// long as two threads do not write the same song id at once.
class AlbumArtStore
{
public:
    explicit AlbumArtStore(const QString& directory = QString());

    QString directory() const { return m_directory; }

    // Writes |data| as the art of |songId| and returns its reference, or an
    // empty string if the bytes are not a readable image or cannot be written.
    QString save(const QByteArray& data, qint64 songId);

    // Reference of previously saved art, or an empty string.
    QString referenceFor(qint64 songId) const;

    bool markNoArt(qint64 songId);
    bool hasNoArtMarker(qint64 songId) const;
    bool clearNoArtMarker(qint64 songId);

    QString artFilePath(qint64 songId) const;
    QString markerFilePath(qint64 songId) const;

    static QString defaultDirectory();
    static QString detectImageFormat(const QByteArray& data);

private:
    bool ensureDirectory() const;

    QString m_directory;
};

} // namespace Songbook

#endif // ALBUMARTSTORE_H
