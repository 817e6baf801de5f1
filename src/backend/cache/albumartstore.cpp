#include "albumartstore.h"
#include <QBuffer>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImageReader>
#include <QSaveFile>
#include <QStandardPaths>
#include <QUrl>

namespace Songbook {

AlbumArtStore::AlbumArtStore(const QString& directory)
    : m_directory(directory.isEmpty() ? defaultDirectory() : QDir::cleanPath(directory))
{
}

QString AlbumArtStore::defaultDirectory()
{
    QString cachePath = QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
    return cachePath + "/albumart";
}

QString AlbumArtStore::artFilePath(qint64 songId) const
{
    return QString("%1/song_art_%2.jpg").arg(m_directory).arg(songId);
}

QString AlbumArtStore::markerFilePath(qint64 songId) const
{
    return QString("%1/song_art_%2_no.jpg").arg(m_directory).arg(songId);
}

bool AlbumArtStore::ensureDirectory() const
{
    QDir dir(m_directory);
    if (dir.exists()) {
        return true;
    }
    if (!dir.mkpath(".")) {
        qWarning() << "AlbumArtStore: Could not create directory" << m_directory;
        return false;
    }
    return true;
}

QString AlbumArtStore::save(const QByteArray& data, qint64 songId)
{
    if (data.isEmpty()) {
        return QString();
    }

    if (detectImageFormat(data).isEmpty()) {
        qWarning() << "AlbumArtStore: Embedded picture of song" << songId << "is not a readable image";
        return QString();
    }

    if (!ensureDirectory()) {
        return QString();
    }

    const QString path = artFilePath(songId);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "AlbumArtStore: Failed to open" << path << ":" << file.errorString();
        return QString();
    }
    if (file.write(data) != data.size() || !file.commit()) {
        qWarning() << "AlbumArtStore: Failed to write" << path << ":" << file.errorString();
        return QString();
    }

    return QUrl::fromLocalFile(path).toString();
}

QString AlbumArtStore::referenceFor(qint64 songId) const
{
    const QString path = artFilePath(songId);
    QFileInfo info(path);
    if (!info.exists() || info.size() == 0) {
        return QString();
    }
    return QUrl::fromLocalFile(path).toString();
}

bool AlbumArtStore::markNoArt(qint64 songId)
{
    if (!ensureDirectory()) {
        return false;
    }

    QFile marker(markerFilePath(songId));
    if (marker.exists()) {
        return true;
    }
    if (!marker.open(QIODevice::WriteOnly)) {
        qWarning() << "AlbumArtStore: Could not create marker" << marker.fileName() << ":" << marker.errorString();
        return false;
    }
    marker.close();
    return true;
}

bool AlbumArtStore::hasNoArtMarker(qint64 songId) const
{
    return QFile::exists(markerFilePath(songId));
}

bool AlbumArtStore::clearNoArtMarker(qint64 songId)
{
    const QString path = markerFilePath(songId);
    if (!QFile::exists(path)) {
        return true;
    }
    if (!QFile::remove(path)) {
        qWarning() << "AlbumArtStore: Could not remove marker" << path;
        return false;
    }
    return true;
}

QString AlbumArtStore::detectImageFormat(const QByteArray& data)
{
    QBuffer buffer;
    buffer.setData(data);
    buffer.open(QIODevice::ReadOnly);

    QImageReader reader(&buffer);
    if (!reader.canRead()) {
        return QString();
    }

    const QByteArray format = reader.format();
    if (format == "jpeg" || format == "jpg") {
        return "image/jpeg";
    } else if (format == "png") {
        return "image/png";
    } else if (format == "gif") {
        return "image/gif";
    } else if (format == "bmp") {
        return "image/bmp";
    }
    return QString("image/%1").arg(QString::fromLatin1(format));
}

} // namespace Songbook
