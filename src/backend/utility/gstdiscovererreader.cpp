#include "gstdiscovererreader.h"
#include "metadataextractor.h"
#include <QDebug>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>

#include <gst/gst.h>
#include <gst/pbutils/pbutils.h>

namespace Songbook {

namespace {
QMutex s_initMutex;
bool s_gstInitialized = false;
}

GstDiscovererReader::GstDiscovererReader(int timeoutSeconds)
    : m_timeoutSeconds(timeoutSeconds)
{
}

bool GstDiscovererReader::ensureInitialized()
{
    QMutexLocker locker(&s_initMutex);
    if (s_gstInitialized) {
        return true;
    }

    GError *error = nullptr;
    if (!gst_init_check(nullptr, nullptr, &error)) {
        qCritical() << "GstDiscovererReader: Failed to initialize GStreamer:" << (error ? error->message : "Unknown error");
        if (error) g_error_free(error);
        return false;
    }
    s_gstInitialized = true;
    return true;
}

QString GstDiscovererReader::normalizeCapsName(const QString &capsName)
{
    if (capsName == "audio/x-flac") {
        return "audio/flac";
    } else if (capsName == "audio/x-vorbis") {
        return "audio/vorbis";
    } else if (capsName == "audio/x-opus") {
        return "audio/opus";
    } else if (capsName == "audio/x-wav" || capsName == "audio/x-raw") {
        return "audio/wav";
    } else if (capsName == "audio/x-alac") {
        return "audio/alac";
    } else if (capsName == "audio/x-wma") {
        return "audio/x-ms-wma";
    }
    return capsName;
}

AudioMeta GstDiscovererReader::readProperties(const QString &filePath)
{
    AudioMeta meta;

    if (!MetadataExtractor::isReadableFile(filePath) || !ensureInitialized()) {
        return meta;
    }

    GError *error = nullptr;
    GstDiscoverer *discoverer = gst_discoverer_new(static_cast<GstClockTime>(m_timeoutSeconds) * GST_SECOND, &error);
    if (!discoverer) {
        qWarning() << "GstDiscovererReader: Could not create discoverer:" << (error ? error->message : "Unknown error");
        g_clear_error(&error);
        return meta;
    }

    gchar *uri = gst_filename_to_uri(QFile::encodeName(filePath).constData(), &error);
    if (!uri) {
        qWarning() << "GstDiscovererReader: Invalid path" << filePath << ":" << (error ? error->message : "Unknown error");
        g_clear_error(&error);
        g_object_unref(discoverer);
        return meta;
    }

    GstDiscovererInfo *info = gst_discoverer_discover_uri(discoverer, uri, &error);
    g_free(uri);

    if (error) {
        qWarning() << "GstDiscovererReader: Discovery failed for" << filePath << ":" << error->message;
        g_clear_error(&error);
    }

    if (info) {
        GList *audioStreams = gst_discoverer_info_get_audio_streams(info);
        if (audioStreams) {
            auto *audioInfo = GST_DISCOVERER_AUDIO_INFO(audioStreams->data);

            const guint sampleRate = gst_discoverer_audio_info_get_sample_rate(audioInfo);
            if (sampleRate > 0) {
                meta.sampleRate = static_cast<int>(sampleRate);
            }

            guint bitrate = gst_discoverer_audio_info_get_bitrate(audioInfo);
            if (bitrate == 0) {
                bitrate = gst_discoverer_audio_info_get_max_bitrate(audioInfo);
            }
            if (bitrate > 0) {
                meta.bitrate = static_cast<int>(bitrate);
            }

            GstCaps *caps = gst_discoverer_stream_info_get_caps(GST_DISCOVERER_STREAM_INFO(audioInfo));
            if (caps) {
                if (gst_caps_get_size(caps) > 0) {
                    const GstStructure *structure = gst_caps_get_structure(caps, 0);
                    meta.mimeType = normalizeCapsName(QString::fromUtf8(gst_structure_get_name(structure)));
                }
                gst_caps_unref(caps);
            }

            gst_discoverer_stream_info_list_free(audioStreams);
        } else {
            qDebug() << "GstDiscovererReader: No audio stream found in" << filePath;
        }
        gst_discoverer_info_unref(info);
    }

    g_object_unref(discoverer);
    return meta;
}

} // namespace Songbook
