#ifndef EXTRACTIONADAPTERS_H
#define EXTRACTIONADAPTERS_H

#include <QByteArray>
#include <QString>
#include <optional>

#include "../library/libraryentities.h"

namespace Songbook {

struct EmbeddedPicture {
    QByteArray data;
};

// Reads the picture embedded in an audio file's tags.
// Implementations are called from several scan workers at once and must not
// share per-file state between calls. Failures are reported as an empty result,
// never thrown.
class EmbeddedArtReader
{
public:
    virtual ~EmbeddedArtReader() = default;
    virtual std::optional<EmbeddedPicture> readEmbeddedPicture(const QString &filePath) = 0;
};

// Reads codec properties (mime type, bitrate, sample rate). Fields that cannot be
// determined are left null. Same threading and failure rules as EmbeddedArtReader.
class AudioPropertiesReader
{
public:
    virtual ~AudioPropertiesReader() = default;
    virtual AudioMeta readProperties(const QString &filePath) = 0;
};

} // namespace Songbook

#endif // EXTRACTIONADAPTERS_H
