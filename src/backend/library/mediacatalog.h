#ifndef MEDIACATALOG_H
#define MEDIACATALOG_H

#include <QFileInfo>
#include <QList>
#include <QString>
#include <QStringList>
#include <atomic>

#include "libraryentities.h"
#include "../utility/metadataextractor.h"

namespace Songbook {

// Source of the raw file records a sync starts from.
class MediaCatalog
{
public:
    virtual ~MediaCatalog() = default;

    // Fills |records| with every audio file the catalog knows about. Returns false
    // when the catalog itself could not be read. Stops early once |cancelFlag| is
    // set. Enumeration must not open the files; records may come back with only
    // their path, id, size and modification time filled in.
    virtual bool enumerate(QList<RawFileRecord>& records, const std::atomic<bool>* cancelFlag = nullptr) = 0;

    // Completes an enumerated record with its tags. A file that cannot be parsed
    // is not an error and comes back with the tags left empty. Called from scan
    // workers, only for files the directory rules accepted.
    virtual RawFileRecord readTags(const RawFileRecord& record) const { return record; }

    virtual QString lastError() const = 0;
};

// Catalog over one or more music folders on the local file system.
class FileSystemCatalog : public MediaCatalog
{
public:
    explicit FileSystemCatalog(const QStringList& musicFolders);

    bool enumerate(QList<RawFileRecord>& records, const std::atomic<bool>* cancelFlag = nullptr) override;
    RawFileRecord readTags(const RawFileRecord& record) const override;
    QString lastError() const override { return m_lastError; }

    QStringList musicFolders() const { return m_musicFolders; }

    static RawFileRecord fileRecord(const QFileInfo& fileInfo);
    static bool isMusicFile(const QFileInfo& fileInfo);

private:
    void processDirectory(const QString& dir, QList<RawFileRecord>& records,
                          const std::atomic<bool>* cancelFlag) const;

    QStringList m_musicFolders;
    MetadataExtractor m_extractor;
    QString m_lastError;
};

} // namespace Songbook

#endif // MEDIACATALOG_H
