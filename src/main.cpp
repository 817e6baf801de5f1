#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <QTimer>
#include <QDebug>
#include <QMap>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>

#include "backend/cache/albumartcache.h"
#include "backend/cache/albumartstore.h"
#include "backend/cache/audiopropertiescache.h"
#include "backend/database/databasemanager.h"
#include "backend/library/librarysyncmanager.h"
#include "backend/library/mediacatalog.h"
#include "backend/settings/settingsmanager.h"
#include "backend/utility/gstdiscovererreader.h"
#include "backend/utility/metadataextractor.h"

namespace {

bool s_verbose = false;
std::atomic<bool> s_interrupted(false);

void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    Q_UNUSED(context)

    switch (type) {
        case QtDebugMsg:
            if (s_verbose) {
                fprintf(stderr, "[Debug] %s\n", qPrintable(msg));
            }
            break;
        case QtInfoMsg:
            fprintf(stderr, "Info: %s\n", qPrintable(msg));
            break;
        case QtWarningMsg:
            fprintf(stderr, "[Warning] %s\n", qPrintable(msg));
            break;
        case QtCriticalMsg:
            fprintf(stderr, "Critical: %s\n", qPrintable(msg));
            break;
        case QtFatalMsg:
            fprintf(stderr, "Fatal: %s\n", qPrintable(msg));
            abort();
    }
}

void handleInterrupt(int)
{
    s_interrupted = true;
}

} // namespace

int main(int argc, char *argv[])
{
    qInstallMessageHandler(messageHandler);

    QCoreApplication app(argc, argv);
    app.setOrganizationName("songbook");
    app.setApplicationName("songbook");
    app.setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Synchronises a music library into the Songbook database.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption settingsOption("settings", "Settings file to read and update.", "file");
    QCommandLineOption databaseOption("database", "Library database file.", "file");
    QCommandLineOption artCacheOption("art-cache", "Directory for extracted cover art.", "dir");
    QCommandLineOption folderOption("folder", "Add a music folder (repeatable).", "dir");
    QCommandLineOption blockOption("block", "Exclude a directory (repeatable).", "dir");
    QCommandLineOption allowOption("allow", "Only include this directory (repeatable).", "dir");
    QCommandLineOption deepOption("deep", "Re-extract cover art and audio properties for every file.");
    QCommandLineOption verboseOption("verbose", "Print debug output.");
    QCommandLineOption statsOption("stats", "Print library statistics after the sync.");
    parser.addOptions({settingsOption, databaseOption, artCacheOption, folderOption,
                       blockOption, allowOption, deepOption, verboseOption, statsOption});
    parser.process(app);

    s_verbose = parser.isSet(verboseOption);

    Songbook::SettingsManager settings(parser.value(settingsOption));
    if (!settings.isValid()) {
        qCritical() << "Main:" << settings.errorString();
        return 1;
    }

    for (const QString &folder : parser.values(folderOption)) {
        settings.addMusicFolder(folder);
    }
    for (const QString &dir : parser.values(blockOption)) {
        settings.addBlockedDirectory(dir);
    }
    for (const QString &dir : parser.values(allowOption)) {
        settings.addAllowedDirectory(dir);
    }

    Songbook::SyncPreferences preferences = settings.snapshot();
    if (parser.isSet(deepOption)) {
        preferences.deepScan = true;
    }

    Songbook::DatabaseManager database;
    QObject::connect(&database, &Songbook::DatabaseManager::databaseError,
                     [](const QString &error) {
        qDebug() << "Main: Database reported:" << error;
    });
    if (!database.initializeDatabase(parser.value(databaseOption))) {
        qCritical() << "Main: Could not open the library database";
        return 1;
    }

    Songbook::AlbumArtStore artStore(parser.value(artCacheOption));
    Songbook::TagLibArtReader artReader;
    Songbook::TagLibPropertiesReader fastReader;
    Songbook::GstDiscovererReader slowReader;

    Songbook::AlbumArtCache artCache(artReader, artStore);
    Songbook::AudioPropertiesCache propertiesCache(database, fastReader, slowReader);

    Songbook::FileSystemCatalog catalog(preferences.musicFolders);
    Songbook::LibrarySyncManager syncManager(catalog, database, artCache, propertiesCache);

    QObject::connect(&syncManager, &Songbook::LibrarySyncManager::batchProcessed,
                     [](int processed, int total) {
        qInfo() << "Main: Deep scan" << processed << "/" << total;
    });
    QObject::connect(&syncManager, &Songbook::LibrarySyncManager::syncingChanged,
                     &app, [&syncManager, &app]() {
        if (!syncManager.isSyncing()) {
            app.quit();
        }
    });

    std::signal(SIGINT, handleInterrupt);
    QTimer interruptPoll;
    QObject::connect(&interruptPoll, &QTimer::timeout, [&syncManager]() {
        if (s_interrupted.exchange(false)) {
            qInfo() << "Main: Interrupted, cancelling sync";
            syncManager.cancelSync();
        }
    });
    interruptPoll.start(100);

    qInfo() << "Main: Syncing" << preferences.musicFolders.join(", ")
            << (preferences.deepScan ? "(deep scan)" : "");
    if (!syncManager.startSync(preferences)) {
        qCritical() << "Main: Sync could not be started";
        return 1;
    }
    app.exec();

    const Songbook::LibrarySyncManager::SyncResult result = syncManager.lastResult();

    if (parser.isSet(statsOption)) {
        QMap<QString, int> formats;
        const QHash<QString, int> mimeTypes = database.mimeTypeCounts();
        for (auto it = mimeTypes.cbegin(); it != mimeTypes.cend(); ++it) {
            Songbook::AudioMeta meta;
            meta.mimeType = it.key();
            formats[meta.formatName()] += it.value();
        }
        QStringList formatSummary;
        for (auto it = formats.cbegin(); it != formats.cend(); ++it) {
            formatSummary << QString("%1 %2").arg(it.key()).arg(it.value());
        }

        QTextStream out(stdout);
        out << "State:        " << Songbook::LibrarySyncManager::stateName(result.state) << "\n"
            << "Enumerated:   " << result.enumerated << "\n"
            << "Excluded:     " << result.filteredOut << "\n"
            << "Deep scanned: " << result.deepScanned << "\n"
            << "Songs:        " << database.songCount() << "\n"
            << "Albums:       " << database.albumCount() << "\n"
            << "Artists:      " << database.artistCount() << "\n"
            << "Artist links: " << database.crossRefCount() << "\n"
            << "Formats:      " << formatSummary.join(", ") << "\n";
    }

    switch (result.state) {
    case Songbook::LibrarySyncManager::Done:
        return 0;
    case Songbook::LibrarySyncManager::Cancelled:
        return 2;
    default:
        qCritical() << "Main: Sync failed:" << result.error;
        return 1;
    }
}
