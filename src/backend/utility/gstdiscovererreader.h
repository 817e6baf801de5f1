#ifndef GSTDISCOVERERREADER_H
#define GSTDISCOVERERREADER_H

#include <QString>

#include "extractionadapters.h"

namespace Songbook {

// Slow fallback: lets GStreamer demux the container and reports the caps of the
// first audio stream. Used only on deep scans, to fill what TagLib missed.
class GstDiscovererReader : public AudioPropertiesReader
{
public:
    explicit GstDiscovererReader(int timeoutSeconds = 10);

    AudioMeta readProperties(const QString &filePath) override;

    static bool ensureInitialized();
    static QString normalizeCapsName(const QString &capsName);

private:
    int m_timeoutSeconds;
};

} // namespace Songbook

#endif // GSTDISCOVERERREADER_H
