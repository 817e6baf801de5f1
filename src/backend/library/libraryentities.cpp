#include "libraryentities.h"
#include <QCryptographicHash>
#include <QDir>
#include <QFileInfo>
#include <QtEndian>

namespace Songbook {

QString AudioMeta::formatName() const
{
    const QString mime = mimeType.toLower();
    if (mime == "audio/mpeg") {
        return "mp3";
    } else if (mime == "audio/flac") {
        return "flac";
    } else if (mime == "audio/x-wav" || mime == "audio/wav") {
        return "wav";
    } else if (mime == "audio/ogg") {
        return "ogg";
    } else if (mime == "audio/mp4" || mime == "audio/m4a") {
        return "m4a";
    } else if (mime == "audio/aac") {
        return "aac";
    } else if (mime == "audio/amr") {
        return "amr";
    }
    return "-";
}

QString RawFileRecord::parentDirectory() const
{
    return QDir::cleanPath(QFileInfo(filePath).absolutePath());
}

QString RawFileRecord::displayTitle() const
{
    const QString trimmed = title.trimmed();
    if (!trimmed.isEmpty()) {
        return trimmed;
    }
    return QFileInfo(filePath).completeBaseName();
}

qint64 RawFileRecord::stableIdForPath(const QString& filePath)
{
    // First 8 bytes of the SHA-1 of the cleaned path, sign bit cleared so the id
    // is always a positive SQLite INTEGER.
    const QByteArray digest = QCryptographicHash::hash(QDir::cleanPath(filePath).toUtf8(),
                                                       QCryptographicHash::Sha1);
    quint64 value = qFromBigEndian<quint64>(reinterpret_cast<const uchar*>(digest.constData()));
    value &= Q_UINT64_C(0x7fffffffffffffff);
    if (value == 0) {
        value = 1;
    }
    return static_cast<qint64>(value);
}

} // namespace Songbook
