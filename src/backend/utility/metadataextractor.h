#ifndef METADATAEXTRACTOR_H
#define METADATAEXTRACTOR_H

#include <QString>
#include <QByteArray>
#include <memory>

#include <taglib/fileref.h>
#include <taglib/tfilestream.h>

#include "extractionadapters.h"

namespace Songbook {

// An open TagLib file. Tries the path first and falls back to a descriptor-based
// stream when TagLib rejects the path (unusual encodings, special files).
// The stream, when used, must outlive the FileRef, hence the member order.
class TagLibFile
{
public:
    TagLibFile(const QString &filePath, bool readAudioProperties,
               TagLib::AudioProperties::ReadStyle readStyle = TagLib::AudioProperties::Average);
    ~TagLibFile();

    TagLibFile(const TagLibFile &) = delete;
    TagLibFile &operator=(const TagLibFile &) = delete;

    bool isValid() const { return !m_fileRef.isNull(); }
    TagLib::File *file() const { return m_fileRef.file(); }
    TagLib::Tag *tag() const { return m_fileRef.tag(); }
    TagLib::AudioProperties *audioProperties() const { return m_fileRef.audioProperties(); }

private:
    std::unique_ptr<TagLib::FileStream> m_stream;
    TagLib::FileRef m_fileRef;
};

class MetadataExtractor
{
public:
    struct TrackMetadata {
        QString title;
        QString artist;
        QString albumArtist;
        QString album;
        QString genre;
        int year = 0;
        int trackNumber = 0;
        qint64 durationMs = 0;
        bool valid = false;
    };

    // Container tags plus duration. Audio properties are read with the fast
    // read style since only the length is needed here.
    TrackMetadata extract(const QString &filePath) const;

    static bool isReadableFile(const QString &filePath);
};

// Embedded picture extraction: ID3v2 APIC, MP4 covr, FLAC picture blocks and
// Xiph picture comments. Front covers are preferred when a file carries several.
class TagLibArtReader : public EmbeddedArtReader
{
public:
    std::optional<EmbeddedPicture> readEmbeddedPicture(const QString &filePath) override;
};

// Fast properties path. The mime type comes from the container type TagLib
// detected; bitrate is reported by TagLib in kbit/s.
class TagLibPropertiesReader : public AudioPropertiesReader
{
public:
    AudioMeta readProperties(const QString &filePath) override;

    static QString mimeTypeForFile(TagLib::File *file);
};

} // namespace Songbook

#endif // METADATAEXTRACTOR_H
