#ifndef LIBRARYSYNCMANAGER_H
#define LIBRARYSYNCMANAGER_H

#include <QObject>
#include <QString>
#include <QFuture>
#include <QFutureWatcher>
#include <QMutex>
#include <atomic>

#include "libraryentities.h"
#include "../settings/settingsmanager.h"

namespace Songbook {

class MediaCatalog;
class LibraryStore;
class AlbumArtCache;
class AudioPropertiesCache;
class LibraryMerger;

// Drives one library sync from the catalog to the store:
//
//   Idle -> Enumerating -> Filtering -> (DeepScanning) -> Merging -> Persisting -> Done
//
// Failed is reachable from every step, Cancelled from every step before
// Persisting. Directory rules are applied to every record before any file is
// opened; tags are then read for the accepted files only. DeepScanning only
// runs when the preferences ask for it; it extracts art and codec properties
// in bounded parallel batches. Everything is written
// in one store transaction, so a failed sync leaves the previous library intact.
class LibrarySyncManager : public QObject
{
    Q_OBJECT
    Q_PROPERTY(SyncState state READ state NOTIFY stateChanged)
    Q_PROPERTY(bool syncing READ isSyncing NOTIFY syncingChanged)
    Q_PROPERTY(int scanProgress READ scanProgress NOTIFY scanProgressChanged)

public:
    enum SyncState {
        Idle,
        Enumerating,
        Filtering,
        DeepScanning,
        Merging,
        Persisting,
        Done,
        Failed,
        Cancelled
    };
    Q_ENUM(SyncState)

    struct SyncResult {
        SyncState state = Idle;
        QString error;
        int enumerated = 0;
        int filteredOut = 0;
        int deepScanned = 0;
        int songsWritten = 0;
        int albumsWritten = 0;
        int artistsWritten = 0;
        int crossRefsWritten = 0;

        bool succeeded() const { return state == Done; }
    };

    LibrarySyncManager(MediaCatalog& catalog,
                       LibraryStore& store,
                       AlbumArtCache& artCache,
                       AudioPropertiesCache& propertiesCache,
                       QObject *parent = nullptr);
    ~LibrarySyncManager();

    // Blocking sync on the calling thread.
    SyncResult runSync(const SyncPreferences& preferences);
    // Refuses to start when the settings could not be read.
    SyncResult runSync(const SettingsManager& settings);

    // Runs the sync on a worker thread; false if one is already running.
    bool startSync(const SyncPreferences& preferences);
    void cancelSync();
    void waitForFinished();

    bool isSyncing() const { return m_syncing; }
    SyncState state() const { return static_cast<SyncState>(m_state.load()); }
    int scanProgress() const { return m_scanProgress; }
    SyncResult lastResult() const;

    // Single lookups outside a sync, never forcing re-extraction.
    QString albumArtForSong(qint64 songId);
    AudioMeta audioMetaForSong(qint64 songId);

    static QString stateName(SyncState state);
    static int chunkSizeFor(int fieldCount, int maxBoundParameters);
    // Art cache key of an album; |albumOwner| as given by LibraryMerger::albumOwner()
    static qint64 albumArtKey(const QString& albumTitle, const QString& albumOwner);

signals:
    void stateChanged(Songbook::LibrarySyncManager::SyncState state);
    void syncingChanged();
    void scanProgressChanged();
    void batchProcessed(int processed, int total);
    void syncCompleted();
    void syncFailed(const QString& error);
    void syncCancelled();

private slots:
    void onSyncFinished();

private:
    bool claimSync();
    void releaseSync();
    static SyncResult busyResult();

    SyncResult performSync(const SyncPreferences& preferences);
    ScannedTrack scanTrack(const RawFileRecord& record, const LibraryMerger& merger, bool deepScan);
    bool persist(const MergeResult& merged, SyncResult& result);

    void setState(SyncState state);
    SyncResult fail(SyncResult& result, const QString& error);
    SyncResult cancel(SyncResult& result);
    void finish(const SyncResult& result);

    MediaCatalog& m_catalog;
    LibraryStore& m_store;
    AlbumArtCache& m_artCache;
    AudioPropertiesCache& m_propertiesCache;

    std::atomic<int> m_state;
    std::atomic<bool> m_syncing;
    std::atomic<bool> m_cancelRequested;
    std::atomic<int> m_scanProgress;

    QFuture<SyncResult> m_syncFuture;
    QFutureWatcher<SyncResult> m_syncWatcher;

    mutable QMutex m_resultMutex;
    SyncResult m_lastResult;
};

} // namespace Songbook

#endif // LIBRARYSYNCMANAGER_H
