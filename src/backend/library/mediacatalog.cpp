#include "mediacatalog.h"
#include <QDebug>
#include <QDir>
#include <QDirIterator>

namespace Songbook {

FileSystemCatalog::FileSystemCatalog(const QStringList& musicFolders)
    : m_musicFolders(musicFolders)
{
}

bool FileSystemCatalog::enumerate(QList<RawFileRecord>& records, const std::atomic<bool>* cancelFlag)
{
    m_lastError.clear();
    records.clear();

    if (m_musicFolders.isEmpty()) {
        m_lastError = "No music folders configured";
        qWarning() << "FileSystemCatalog:" << m_lastError;
        return false;
    }

    int readableFolders = 0;
    for (const QString& folder : m_musicFolders) {
        if (cancelFlag && cancelFlag->load()) {
            break;
        }

        const QFileInfo folderInfo(folder);
        if (!folderInfo.isDir() || !folderInfo.isReadable()) {
            qWarning() << "FileSystemCatalog: Skipping unreadable music folder" << folder;
            continue;
        }

        ++readableFolders;
        const qsizetype before = records.size();
        processDirectory(folderInfo.absoluteFilePath(), records, cancelFlag);
        qDebug() << "FileSystemCatalog: Found" << records.size() - before << "files in" << folder;
    }

    if (readableFolders == 0) {
        m_lastError = QString("None of the music folders can be read: %1").arg(m_musicFolders.join(", "));
        qCritical() << "FileSystemCatalog:" << m_lastError;
        return false;
    }

    return true;
}

void FileSystemCatalog::processDirectory(const QString& dir, QList<RawFileRecord>& records,
                                         const std::atomic<bool>* cancelFlag) const
{
    QDirIterator it(dir, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);

    while (it.hasNext()) {
        if (cancelFlag && cancelFlag->load()) {
            return;
        }

        it.next();
        const QFileInfo fileInfo = it.fileInfo();
        if (fileInfo.isFile() && isMusicFile(fileInfo)) {
            records.append(fileRecord(fileInfo));
        }
    }
}

RawFileRecord FileSystemCatalog::fileRecord(const QFileInfo& fileInfo)
{
    RawFileRecord record;
    record.filePath = QDir::cleanPath(fileInfo.absoluteFilePath());
    record.id = RawFileRecord::stableIdForPath(record.filePath);
    record.fileSize = fileInfo.size();
    record.dateModified = fileInfo.lastModified();
    return record;
}

RawFileRecord FileSystemCatalog::readTags(const RawFileRecord& record) const
{
    RawFileRecord tagged = record;

    const MetadataExtractor::TrackMetadata meta = m_extractor.extract(record.filePath);
    if (meta.valid) {
        tagged.title = meta.title;
        tagged.artist = meta.artist;
        tagged.album = meta.album;
        tagged.albumArtist = meta.albumArtist;
        tagged.genre = meta.genre;
        tagged.year = meta.year;
        tagged.trackNumber = meta.trackNumber;
        tagged.durationMs = meta.durationMs;
    }
    return tagged;
}

bool FileSystemCatalog::isMusicFile(const QFileInfo& fileInfo)
{
    static const QStringList musicExtensions = {
        "mp3", "m4a", "m4p", "mp4", "aac", "ogg", "oga", "opus",
        "flac", "wav", "wma", "ape", "mka", "wv", "tta", "aiff", "aif", "dsf"
    };

    return musicExtensions.contains(fileInfo.suffix().toLower());
}

} // namespace Songbook
