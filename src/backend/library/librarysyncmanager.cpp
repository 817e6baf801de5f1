#include "librarysyncmanager.h"
#include "directoryrules.h"
#include "librarymerger.h"
#include "mediacatalog.h"
#include "../cache/albumartcache.h"
#include "../cache/audiopropertiescache.h"
#include "../database/librarystore.h"
#include "../utility/parallelbatch.h"
#include <QDebug>
#include <QElapsedTimer>
#include <QMutexLocker>
#include <QtConcurrent>

namespace Songbook {

namespace {

template <typename Entity, typename Writer>
bool writeInChunks(const QList<Entity>& entities, int chunkSize, Writer writer)
{
    for (qsizetype start = 0; start < entities.size(); start += chunkSize) {
        if (!writer(entities.mid(start, chunkSize))) {
            return false;
        }
    }
    return true;
}

} // namespace

LibrarySyncManager::LibrarySyncManager(MediaCatalog& catalog,
                                       LibraryStore& store,
                                       AlbumArtCache& artCache,
                                       AudioPropertiesCache& propertiesCache,
                                       QObject *parent)
    : QObject(parent)
    , m_catalog(catalog)
    , m_store(store)
    , m_artCache(artCache)
    , m_propertiesCache(propertiesCache)
    , m_state(Idle)
    , m_syncing(false)
    , m_cancelRequested(false)
    , m_scanProgress(0)
{
    connect(&m_syncWatcher, &QFutureWatcher<SyncResult>::finished,
            this, &LibrarySyncManager::onSyncFinished);
}

LibrarySyncManager::~LibrarySyncManager()
{
    cancelSync();
    waitForFinished();
}

LibrarySyncManager::SyncResult LibrarySyncManager::runSync(const SyncPreferences& preferences)
{
    if (!claimSync()) {
        return busyResult();
    }

    SyncResult result = performSync(preferences);
    releaseSync();
    return result;
}

LibrarySyncManager::SyncResult LibrarySyncManager::runSync(const SettingsManager& settings)
{
    if (!claimSync()) {
        return busyResult();
    }

    SyncResult result;
    if (settings.isValid()) {
        result = performSync(settings.snapshot());
    } else {
        result = fail(result, QString("Preferences unavailable: %1").arg(settings.errorString()));
    }
    releaseSync();
    return result;
}

bool LibrarySyncManager::startSync(const SyncPreferences& preferences)
{
    if (!claimSync()) {
        return false;
    }

    m_syncFuture = QtConcurrent::run([this, preferences]() {
        SyncResult result = performSync(preferences);
        // Connections are bound to this pool thread
        m_store.releaseThreadConnection();
        return result;
    });
    m_syncWatcher.setFuture(m_syncFuture);
    return true;
}

bool LibrarySyncManager::claimSync()
{
    if (m_syncing.exchange(true)) {
        qWarning() << "LibrarySyncManager: Sync already in progress";
        return false;
    }
    m_cancelRequested = false;
    emit syncingChanged();
    return true;
}

void LibrarySyncManager::releaseSync()
{
    m_store.releaseThreadConnection();
    m_syncing = false;
    emit syncingChanged();
}

LibrarySyncManager::SyncResult LibrarySyncManager::busyResult()
{
    SyncResult busy;
    busy.state = Failed;
    busy.error = "A sync is already in progress";
    return busy;
}

void LibrarySyncManager::cancelSync()
{
    if (!m_syncing) {
        return;
    }
    qDebug() << "LibrarySyncManager: Cancellation requested";
    m_cancelRequested = true;
}

void LibrarySyncManager::waitForFinished()
{
    if (m_syncFuture.isRunning()) {
        m_syncFuture.waitForFinished();
    }
}

void LibrarySyncManager::onSyncFinished()
{
    m_syncing = false;
    emit syncingChanged();
}

LibrarySyncManager::SyncResult LibrarySyncManager::lastResult() const
{
    QMutexLocker locker(&m_resultMutex);
    return m_lastResult;
}

LibrarySyncManager::SyncResult LibrarySyncManager::performSync(const SyncPreferences& preferences)
{
    QElapsedTimer timer;
    timer.start();

    SyncResult result;
    m_scanProgress = 0;
    emit scanProgressChanged();

    // Enumerating
    setState(Enumerating);
    QList<RawFileRecord> records;
    if (!m_catalog.enumerate(records, &m_cancelRequested)) {
        return fail(result, QString("Could not enumerate the media catalog: %1").arg(m_catalog.lastError()));
    }
    if (m_cancelRequested) {
        return cancel(result);
    }
    result.enumerated = records.size();
    qInfo() << "LibrarySyncManager: Catalog returned" << records.size() << "files";

    // Filtering, strictly before any file is opened
    setState(Filtering);
    const DirectoryRules rules(preferences.blockedDirectories, preferences.allowedDirectories);
    QList<RawFileRecord> accepted;
    accepted.reserve(records.size());
    for (const RawFileRecord& record : records) {
        if (rules.isAllowed(record.parentDirectory())) {
            accepted.append(record);
        }
    }
    result.filteredOut = records.size() - accepted.size();
    records.clear();
    if (result.filteredOut > 0) {
        qInfo() << "LibrarySyncManager: Directory rules excluded" << result.filteredOut << "files";
    }
    if (m_cancelRequested) {
        return cancel(result);
    }

    // Tags are only read for the files the rules accepted
    ParallelBatchProcessor tagReader(ParallelBatchProcessor::Workload::IoBound);
    tagReader.setCancellationFlag(&m_cancelRequested);
    accepted = tagReader.process(accepted, tagReader.optimalBatchSize(accepted.size()),
        [this](const RawFileRecord& record) {
            return m_catalog.readTags(record);
        });
    if (tagReader.wasCancelled() || m_cancelRequested) {
        return cancel(result);
    }

    const LibraryMerger merger(preferences.artistDelimiters, preferences.useArtistDelimiters);

    QList<ScannedTrack> tracks;
    if (preferences.deepScan) {
        setState(DeepScanning);

        ParallelBatchProcessor processor(ParallelBatchProcessor::Workload::IoBound);
        processor.setCancellationFlag(&m_cancelRequested);
        const int batchSize = processor.optimalBatchSize(accepted.size());
        qDebug() << "LibrarySyncManager: Deep scanning" << accepted.size() << "files in batches of" << batchSize;

        tracks = processor.processWithProgress(accepted, batchSize,
            [this](int processed, int total) {
                m_scanProgress = total > 0 ? (processed * 100) / total : 100;
                emit batchProcessed(processed, total);
                emit scanProgressChanged();
            },
            [this, &merger](const RawFileRecord& record) {
                return scanTrack(record, merger, true);
            });

        if (processor.wasCancelled()) {
            return cancel(result);
        }
        result.deepScanned = tracks.size();
    } else {
        tracks.reserve(accepted.size());
        for (const RawFileRecord& record : accepted) {
            ScannedTrack track;
            track.record = record;
            tracks.append(track);
        }
    }
    accepted.clear();

    // Merging
    setState(Merging);
    if (m_cancelRequested) {
        return cancel(result);
    }

    QList<qint64> songIds;
    songIds.reserve(tracks.size());
    for (const ScannedTrack& track : tracks) {
        songIds.append(track.record.id);
    }

    // Ids and preserved metadata come from the stored library, so all of it must be readable
    QList<Artist> existingArtists;
    QList<Album> existingAlbums;
    QHash<qint64, Song> storedSongs;
    if (!m_store.allArtists(existingArtists)
        || !m_store.allAlbums(existingAlbums)
        || !m_store.songsByIds(songIds, storedSongs)) {
        return fail(result, QString("Could not read the stored library: %1").arg(m_store.lastError()));
    }

    const MergeResult merged = QtConcurrent::run(ParallelBatchProcessor::cpuPool(), [&]() {
        return merger.merge(tracks, existingArtists, existingAlbums, storedSongs);
    }).result();

    if (m_cancelRequested) {
        return cancel(result);
    }

    // Persisting; no cancellation past this point
    setState(Persisting);
    if (!persist(merged, result)) {
        return fail(result, QString("Could not persist the library: %1").arg(m_store.lastError()));
    }

    m_scanProgress = 100;
    emit scanProgressChanged();

    qInfo() << "LibrarySyncManager: Sync finished in" << timer.elapsed() << "ms:"
            << result.songsWritten << "songs," << result.albumsWritten << "albums,"
            << result.artistsWritten << "artists," << result.crossRefsWritten << "cross references";

    result.state = Done;
    finish(result);
    setState(Done);
    emit syncCompleted();
    return result;
}

ScannedTrack LibrarySyncManager::scanTrack(const RawFileRecord& record, const LibraryMerger& merger, bool deepScan)
{
    ScannedTrack track;
    track.record = record;
    track.audioMeta = m_propertiesCache.audioMeta(record.id, record.filePath, deepScan);

    const qint64 artKey = albumArtKey(record.album, merger.albumOwner(record.albumArtist, record.artist));
    track.albumArtUri = m_artCache.albumArtUri(record.filePath, artKey, record.id, deepScan);
    return track;
}

bool LibrarySyncManager::persist(const MergeResult& merged, SyncResult& result)
{
    const int maxParameters = m_store.maxBoundParameters();

    if (!m_store.beginTransaction()) {
        qCritical() << "LibrarySyncManager: Failed to start transaction:" << m_store.lastError();
        return false;
    }

    QList<qint64> songIds;
    songIds.reserve(merged.songs.size());
    for (const Song& song : merged.songs) {
        songIds.append(song.id);
    }

    // Each entity type in its own chunked pass, sized to the store's parameter limit
    const bool written =
        m_store.deleteSongsExcept(songIds)
        && m_store.deleteAllCrossRefs()
        && writeInChunks(merged.artists, chunkSizeFor(Artist::FieldCount, maxParameters),
                         [this](const QList<Artist>& chunk) { return m_store.insertArtists(chunk); })
        && writeInChunks(merged.albums, chunkSizeFor(Album::FieldCount, maxParameters),
                         [this](const QList<Album>& chunk) { return m_store.insertAlbums(chunk); })
        && writeInChunks(merged.songs, chunkSizeFor(Song::FieldCount, maxParameters),
                         [this](const QList<Song>& chunk) { return m_store.insertSongs(chunk); })
        && writeInChunks(merged.crossRefs, chunkSizeFor(SongArtistCrossRef::FieldCount, maxParameters),
                         [this](const QList<SongArtistCrossRef>& chunk) { return m_store.insertCrossRefs(chunk); })
        && m_store.deleteOrphans();

    if (!written) {
        qCritical() << "LibrarySyncManager: Write failed, rolling back:" << m_store.lastError();
        if (!m_store.rollbackTransaction()) {
            qCritical() << "LibrarySyncManager: Rollback failed";
        }
        return false;
    }

    if (!m_store.commitTransaction()) {
        qCritical() << "LibrarySyncManager: Commit failed, rolling back:" << m_store.lastError();
        if (!m_store.rollbackTransaction()) {
            qCritical() << "LibrarySyncManager: Rollback failed";
        }
        return false;
    }

    result.songsWritten = merged.songs.size();
    result.albumsWritten = merged.albums.size();
    result.artistsWritten = merged.artists.size();
    result.crossRefsWritten = merged.crossRefs.size();
    return true;
}

QString LibrarySyncManager::albumArtForSong(qint64 songId)
{
    const std::optional<Song> song = m_store.songById(songId);
    if (!song) {
        qWarning() << "LibrarySyncManager: No song with id" << songId;
        return QString();
    }

    // The stored album carries the owner the songs were filed under
    const std::optional<Album> album = m_store.albumById(song->albumId);
    qint64 artKey = 0;
    if (album) {
        artKey = albumArtKey(album->title, album->artistName);
    } else {
        artKey = albumArtKey(song->albumName, song->albumArtist.isEmpty() ? song->artistName : song->albumArtist);
    }
    return m_artCache.albumArtUri(song->filePath, artKey, songId, false);
}

AudioMeta LibrarySyncManager::audioMetaForSong(qint64 songId)
{
    const std::optional<Song> song = m_store.songById(songId);
    if (!song) {
        qWarning() << "LibrarySyncManager: No song with id" << songId;
        return AudioMeta();
    }
    return m_propertiesCache.audioMeta(songId, song->filePath, false);
}

void LibrarySyncManager::setState(SyncState state)
{
    if (m_state.exchange(state) != state) {
        qDebug() << "LibrarySyncManager: State" << stateName(state);
        emit stateChanged(state);
    }
}

LibrarySyncManager::SyncResult LibrarySyncManager::fail(SyncResult& result, const QString& error)
{
    qCritical() << "LibrarySyncManager:" << error;
    result.state = Failed;
    result.error = error;
    finish(result);
    setState(Failed);
    emit syncFailed(error);
    return result;
}

LibrarySyncManager::SyncResult LibrarySyncManager::cancel(SyncResult& result)
{
    qInfo() << "LibrarySyncManager: Sync cancelled during" << stateName(state());
    result.state = Cancelled;
    finish(result);
    setState(Cancelled);
    emit syncCancelled();
    return result;
}

void LibrarySyncManager::finish(const SyncResult& result)
{
    QMutexLocker locker(&m_resultMutex);
    m_lastResult = result;
}

QString LibrarySyncManager::stateName(SyncState state)
{
    switch (state) {
    case Idle: return "Idle";
    case Enumerating: return "Enumerating";
    case Filtering: return "Filtering";
    case DeepScanning: return "DeepScanning";
    case Merging: return "Merging";
    case Persisting: return "Persisting";
    case Done: return "Done";
    case Failed: return "Failed";
    case Cancelled: return "Cancelled";
    }
    return "Unknown";
}

int LibrarySyncManager::chunkSizeFor(int fieldCount, int maxBoundParameters)
{
    if (fieldCount <= 0) {
        return qMax(1, maxBoundParameters);
    }
    return qMax(1, maxBoundParameters / fieldCount);
}

qint64 LibrarySyncManager::albumArtKey(const QString& albumTitle, const QString& albumOwner)
{
    // Songs filed under the same album share one picture
    const QString title = albumTitle.simplified().isEmpty() ? LibraryMerger::unknownAlbumName() : albumTitle;
    const QString owner = albumOwner.simplified().isEmpty() ? LibraryMerger::unknownArtistName() : albumOwner;
    const size_t hash = qHash(LibraryMerger::albumKey(title, owner));
    return static_cast<qint64>(hash & Q_UINT64_C(0x7fffffffffffffff));
}

} // namespace Songbook
