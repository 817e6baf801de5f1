#include "metadataextractor.h"
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <exception>

#include <fcntl.h>
#include <unistd.h>

// TagLib format-specific includes
#include <taglib/tag.h>
#include <taglib/tpropertymap.h>
#include <taglib/audioproperties.h>
#include <taglib/mpegfile.h>
#include <taglib/id3v2tag.h>
#include <taglib/id3v2frame.h>
#include <taglib/attachedpictureframe.h>
#include <taglib/mp4file.h>
#include <taglib/mp4coverart.h>
#include <taglib/flacfile.h>
#include <taglib/flacpicture.h>
#include <taglib/vorbisfile.h>
#include <taglib/opusfile.h>
#include <taglib/oggflacfile.h>
#include <taglib/xiphcomment.h>
#include <taglib/wavfile.h>
#include <taglib/aifffile.h>
#include <taglib/apefile.h>
#include <taglib/wavpackfile.h>
#include <taglib/asffile.h>

namespace Songbook {

namespace {

QString toQString(const TagLib::String &value)
{
    return QString::fromStdString(value.to8Bit(true)).trimmed();
}

QString firstProperty(const TagLib::PropertyMap &properties, const char *key)
{
    const TagLib::StringList values = properties.value(key);
    if (values.isEmpty()) {
        return QString();
    }
    return toQString(values.front());
}

std::optional<EmbeddedPicture> pictureFromFlacList(const TagLib::List<TagLib::FLAC::Picture *> &pictures)
{
    const TagLib::FLAC::Picture *chosen = nullptr;
    for (const TagLib::FLAC::Picture *picture : pictures) {
        if (!picture || picture->data().isEmpty()) {
            continue;
        }
        if (!chosen || picture->type() == TagLib::FLAC::Picture::FrontCover) {
            chosen = picture;
        }
        if (picture->type() == TagLib::FLAC::Picture::FrontCover) {
            break;
        }
    }

    if (!chosen) {
        return std::nullopt;
    }

    const TagLib::ByteVector data = chosen->data();
    return EmbeddedPicture{QByteArray(data.data(), static_cast<int>(data.size()))};
}

std::optional<EmbeddedPicture> pictureFromId3v2(TagLib::ID3v2::Tag *id3v2Tag)
{
    if (!id3v2Tag) {
        return std::nullopt;
    }

    const TagLib::ID3v2::FrameList frames = id3v2Tag->frameList("APIC");
    const TagLib::ID3v2::AttachedPictureFrame *chosen = nullptr;
    for (TagLib::ID3v2::Frame *frame : frames) {
        auto *pictureFrame = dynamic_cast<TagLib::ID3v2::AttachedPictureFrame *>(frame);
        if (!pictureFrame || pictureFrame->picture().isEmpty()) {
            continue;
        }
        if (!chosen || pictureFrame->type() == TagLib::ID3v2::AttachedPictureFrame::FrontCover) {
            chosen = pictureFrame;
        }
        if (pictureFrame->type() == TagLib::ID3v2::AttachedPictureFrame::FrontCover) {
            break;
        }
    }

    if (!chosen) {
        return std::nullopt;
    }

    const TagLib::ByteVector data = chosen->picture();
    return EmbeddedPicture{QByteArray(data.data(), static_cast<int>(data.size()))};
}

std::optional<EmbeddedPicture> pictureFromMp4(TagLib::MP4::Tag *mp4Tag)
{
    if (!mp4Tag) {
        return std::nullopt;
    }

    TagLib::MP4::ItemMap items = mp4Tag->itemMap();
    if (!items.contains("covr")) {
        return std::nullopt;
    }

    const TagLib::MP4::CoverArtList covers = items["covr"].toCoverArtList();
    for (const TagLib::MP4::CoverArt &cover : covers) {
        const TagLib::ByteVector data = cover.data();
        if (data.isEmpty()) {
            continue;
        }
        return EmbeddedPicture{QByteArray(data.data(), static_cast<int>(data.size()))};
    }
    return std::nullopt;
}

std::optional<EmbeddedPicture> pictureFromXiph(TagLib::Ogg::XiphComment *xiph)
{
    if (!xiph) {
        return std::nullopt;
    }
    return pictureFromFlacList(xiph->pictureList());
}

} // namespace

TagLibFile::TagLibFile(const QString &filePath, bool readAudioProperties,
                       TagLib::AudioProperties::ReadStyle readStyle)
{
    const QByteArray encodedPath = QFile::encodeName(filePath);
    m_fileRef = TagLib::FileRef(encodedPath.constData(), readAudioProperties, readStyle);
    if (!m_fileRef.isNull()) {
        return;
    }

    // Path access rejected, retry through a descriptor. FileStream takes over the
    // descriptor once it is open and closes it on destruction.
    const int fd = ::open(encodedPath.constData(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return;
    }

    auto stream = std::make_unique<TagLib::FileStream>(fd, true);
    if (!stream->isOpen()) {
        ::close(fd);
        return;
    }

    m_fileRef = TagLib::FileRef(stream.get(), readAudioProperties, readStyle);
    if (m_fileRef.isNull()) {
        qDebug() << "TagLibFile: Descriptor fallback could not identify" << filePath;
        return;
    }

    m_stream = std::move(stream);
}

TagLibFile::~TagLibFile() = default;

bool MetadataExtractor::isReadableFile(const QString &filePath)
{
    const QFileInfo fileInfo(filePath);
    return fileInfo.exists() && fileInfo.isFile() && fileInfo.isReadable();
}

MetadataExtractor::TrackMetadata MetadataExtractor::extract(const QString &filePath) const
{
    TrackMetadata meta;

    if (!isReadableFile(filePath)) {
        qWarning() << "MetadataExtractor: File is missing or not readable:" << filePath;
        return meta;
    }

    try {
        TagLibFile file(filePath, true, TagLib::AudioProperties::Fast);
        if (!file.isValid()) {
            qWarning() << "MetadataExtractor: Could not read metadata for:" << filePath;
            return meta;
        }

        if (TagLib::Tag *tag = file.tag()) {
            meta.title = toQString(tag->title());
            meta.artist = toQString(tag->artist());
            meta.album = toQString(tag->album());
            meta.genre = toQString(tag->genre());
            meta.year = static_cast<int>(tag->year());
            meta.trackNumber = static_cast<int>(tag->track());
        }

        const TagLib::PropertyMap properties = file.file()->properties();
        meta.albumArtist = firstProperty(properties, "ALBUMARTIST");
        if (meta.albumArtist.isEmpty()) {
            meta.albumArtist = firstProperty(properties, "ALBUM ARTIST");
        }

        if (TagLib::AudioProperties *audioProperties = file.audioProperties()) {
            meta.durationMs = audioProperties->lengthInMilliseconds();
        }

        meta.valid = true;
    } catch (const std::exception &e) {
        qWarning() << "MetadataExtractor: Exception while extracting metadata from" << filePath << ":" << e.what();
    }

    return meta;
}

std::optional<EmbeddedPicture> TagLibArtReader::readEmbeddedPicture(const QString &filePath)
{
    if (!MetadataExtractor::isReadableFile(filePath)) {
        return std::nullopt;
    }

    try {
        TagLibFile file(filePath, false);
        if (!file.isValid()) {
            return std::nullopt;
        }

        TagLib::File *base = file.file();
        if (auto *mpegFile = dynamic_cast<TagLib::MPEG::File *>(base)) {
            return mpegFile->hasID3v2Tag() ? pictureFromId3v2(mpegFile->ID3v2Tag()) : std::nullopt;
        }
        if (auto *mp4File = dynamic_cast<TagLib::MP4::File *>(base)) {
            return pictureFromMp4(mp4File->tag());
        }
        if (auto *flacFile = dynamic_cast<TagLib::FLAC::File *>(base)) {
            std::optional<EmbeddedPicture> picture = pictureFromFlacList(flacFile->pictureList());
            if (!picture && flacFile->hasID3v2Tag()) {
                picture = pictureFromId3v2(flacFile->ID3v2Tag());
            }
            return picture;
        }
        if (auto *vorbisFile = dynamic_cast<TagLib::Ogg::Vorbis::File *>(base)) {
            return pictureFromXiph(vorbisFile->tag());
        }
        if (auto *opusFile = dynamic_cast<TagLib::Ogg::Opus::File *>(base)) {
            return pictureFromXiph(opusFile->tag());
        }
        if (auto *oggFlacFile = dynamic_cast<TagLib::Ogg::FLAC::File *>(base)) {
            return pictureFromXiph(oggFlacFile->tag());
        }
        if (auto *wavFile = dynamic_cast<TagLib::RIFF::WAV::File *>(base)) {
            return wavFile->hasID3v2Tag() ? pictureFromId3v2(wavFile->ID3v2Tag()) : std::nullopt;
        }
        if (auto *aiffFile = dynamic_cast<TagLib::RIFF::AIFF::File *>(base)) {
            return aiffFile->hasID3v2Tag() ? pictureFromId3v2(aiffFile->tag()) : std::nullopt;
        }
    } catch (const std::exception &e) {
        qWarning() << "TagLibArtReader: Exception while reading picture from" << filePath << ":" << e.what();
    }

    return std::nullopt;
}

AudioMeta TagLibPropertiesReader::readProperties(const QString &filePath)
{
    AudioMeta meta;

    if (!MetadataExtractor::isReadableFile(filePath)) {
        return meta;
    }

    try {
        TagLibFile file(filePath, true, TagLib::AudioProperties::Average);
        if (!file.isValid()) {
            qWarning() << "TagLibPropertiesReader: Could not open" << filePath;
            return meta;
        }

        meta.mimeType = mimeTypeForFile(file.file());

        if (TagLib::AudioProperties *properties = file.audioProperties()) {
            if (properties->bitrate() > 0) {
                meta.bitrate = properties->bitrate() * 1000;
            }
            if (properties->sampleRate() > 0) {
                meta.sampleRate = properties->sampleRate();
            }
        }
    } catch (const std::exception &e) {
        qWarning() << "TagLibPropertiesReader: Exception while probing" << filePath << ":" << e.what();
    }

    return meta;
}

QString TagLibPropertiesReader::mimeTypeForFile(TagLib::File *file)
{
    if (dynamic_cast<TagLib::MPEG::File *>(file)) {
        return "audio/mpeg";
    } else if (dynamic_cast<TagLib::FLAC::File *>(file)) {
        return "audio/flac";
    } else if (dynamic_cast<TagLib::MP4::File *>(file)) {
        return "audio/mp4";
    } else if (dynamic_cast<TagLib::Ogg::Vorbis::File *>(file)
               || dynamic_cast<TagLib::Ogg::FLAC::File *>(file)) {
        return "audio/ogg";
    } else if (dynamic_cast<TagLib::Ogg::Opus::File *>(file)) {
        return "audio/opus";
    } else if (dynamic_cast<TagLib::RIFF::WAV::File *>(file)) {
        return "audio/wav";
    } else if (dynamic_cast<TagLib::RIFF::AIFF::File *>(file)) {
        return "audio/aiff";
    } else if (dynamic_cast<TagLib::APE::File *>(file)) {
        return "audio/ape";
    } else if (dynamic_cast<TagLib::WavPack::File *>(file)) {
        return "audio/x-wavpack";
    } else if (dynamic_cast<TagLib::ASF::File *>(file)) {
        return "audio/x-ms-wma";
    }
    return QString();
}

} // namespace Songbook
