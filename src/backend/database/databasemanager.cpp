#include "databasemanager.h"
#include <QSqlError>
#include <QSqlQuery>
#include <QStandardPaths>
#include <QDir>
#include <QFileInfo>
#include <QDebug>
#include <QVariant>
#include <QMutexLocker>
#include <QThread>

namespace Songbook {

namespace {

const QStringList ARTIST_COLUMNS = {"id", "name"};

const QStringList ALBUM_COLUMNS = {
    "id", "title", "artist_name", "artist_id", "year", "song_count", "album_art_uri"
};

const QStringList SONG_COLUMNS = {
    "id", "title", "artist_name", "artist_id", "album_artist", "album_name", "album_id",
    "file_path", "parent_directory", "duration_ms", "track_number", "year", "genre",
    "mime_type", "bitrate", "sample_rate", "album_art_uri", "date_modified"
};

const QStringList CROSS_REF_COLUMNS = {"song_id", "artist_id", "is_primary"};

QVariant nullable(const QString& value)
{
    return value.isEmpty() ? QVariant() : QVariant(value);
}

QVariant nullable(const std::optional<int>& value)
{
    return value ? QVariant(*value) : QVariant();
}

std::optional<int> optionalInt(const QVariant& value)
{
    if (value.isNull()) {
        return std::nullopt;
    }
    return value.toInt();
}

QString placeholders(int count)
{
    return QStringList(count, QStringLiteral("?")).join(", ");
}

} // namespace

DatabaseManager::DatabaseManager(QObject *parent)
    : QObject(parent)
    , m_connectionName(QString("SongbookLibrary_%1").arg(quintptr(this)))
{
}

DatabaseManager::~DatabaseManager()
{
    close();
}

bool DatabaseManager::initializeDatabase(const QString& dbPath)
{
    if (isOpen()) {
        close();
    }

    QString path = dbPath;
    if (path.isEmpty()) {
        path = defaultDatabasePath();
    }

    qDebug() << "DatabaseManager: Database path:" << path;

    // Ensure directory exists
    QDir dir = QFileInfo(path).dir();
    if (!dir.exists()) {
        qDebug() << "DatabaseManager: Creating directory:" << dir.path();
        dir.mkpath(".");
    }

    m_dbPath = path;
    m_db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    m_db.setDatabaseName(path);

    if (!m_db.open()) {
        const QString error = m_db.lastError().text();
        qCritical() << "DatabaseManager: Failed to open database:" << error;
        setLastError(error);
        emit databaseError(error);
        return false;
    }

    QSqlQuery query(m_db);
    query.exec("PRAGMA journal_mode = WAL");
    query.exec("PRAGMA synchronous = NORMAL");
    query.exec("PRAGMA cache_size = -64000"); // 64MB cache
    query.exec("PRAGMA temp_store = MEMORY");
    query.exec("PRAGMA busy_timeout = 5000");

    if (!createTables()) {
        return false;
    }

    if (!createIndexes()) {
        return false;
    }

    qDebug() << "DatabaseManager: Database initialized successfully at:" << path;
    return true;
}

bool DatabaseManager::isOpen() const
{
    return m_db.isOpen();
}

void DatabaseManager::close()
{
    QSet<QString> threadConnections;
    {
        QMutexLocker locker(&m_databaseMutex);
        threadConnections.swap(m_threadConnections);
    }
    // Threads that never released their connection. The handles belong to
    // those threads, so only the registrations are dropped here.
    for (const QString& connectionName : threadConnections) {
        qDebug() << "DatabaseManager: Dropping unreleased connection" << connectionName;
        QSqlDatabase::removeDatabase(connectionName);
    }

    if (m_db.isOpen()) {
        m_db.close();
    }

    // Clear the database object so no query still refers to the connection
    m_db = QSqlDatabase();

    if (QSqlDatabase::contains(m_connectionName)) {
        QSqlDatabase::removeDatabase(m_connectionName);
    }
}

bool DatabaseManager::createTables()
{
    QSqlQuery query(m_db);

    // Schema version table
    if (!query.exec(
        "CREATE TABLE IF NOT EXISTS schema_version ("
        "version INTEGER PRIMARY KEY,"
        "applied_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP"
        ")")) {
        logError("Create schema_version table", query);
        return false;
    }

    int currentVersion = 0;
    if (query.exec("SELECT MAX(version) FROM schema_version") && query.next()) {
        currentVersion = query.value(0).toInt();
    }

    if (!query.exec(
        "CREATE TABLE IF NOT EXISTS artists ("
        "id INTEGER PRIMARY KEY,"
        "name TEXT NOT NULL"
        ")")) {
        logError("Create artists table", query);
        return false;
    }

    if (!query.exec(
        "CREATE TABLE IF NOT EXISTS albums ("
        "id INTEGER PRIMARY KEY,"
        "title TEXT NOT NULL,"
        "artist_name TEXT,"
        "artist_id INTEGER,"
        "year INTEGER,"
        "song_count INTEGER DEFAULT 0,"
        "album_art_uri TEXT"
        ")")) {
        logError("Create albums table", query);
        return false;
    }

    if (!query.exec(
        "CREATE TABLE IF NOT EXISTS songs ("
        "id INTEGER PRIMARY KEY,"
        "title TEXT NOT NULL,"
        "artist_name TEXT,"
        "artist_id INTEGER,"
        "album_artist TEXT,"
        "album_name TEXT,"
        "album_id INTEGER,"
        "file_path TEXT NOT NULL,"
        "parent_directory TEXT,"
        "duration_ms INTEGER,"
        "track_number INTEGER,"
        "year INTEGER,"
        "genre TEXT,"
        "mime_type TEXT,"
        "bitrate INTEGER,"
        "sample_rate INTEGER,"
        "album_art_uri TEXT,"
        "date_modified INTEGER"
        ")")) {
        logError("Create songs table", query);
        return false;
    }

    if (!query.exec(
        "CREATE TABLE IF NOT EXISTS song_artist_cross_ref ("
        "song_id INTEGER NOT NULL,"
        "artist_id INTEGER NOT NULL,"
        "is_primary INTEGER NOT NULL DEFAULT 0,"
        "PRIMARY KEY (song_id, artist_id)"
        ")")) {
        logError("Create song_artist_cross_ref table", query);
        return false;
    }

    if (currentVersion < CURRENT_SCHEMA_VERSION) {
        query.prepare("INSERT INTO schema_version (version) VALUES (:version)");
        query.bindValue(":version", CURRENT_SCHEMA_VERSION);
        if (!query.exec()) {
            logError("Record schema version", query);
            return false;
        }
        qDebug() << "DatabaseManager: Schema upgraded from version" << currentVersion << "to" << CURRENT_SCHEMA_VERSION;
    }

    return true;
}

bool DatabaseManager::createIndexes()
{
    QSqlQuery query(m_db);

    const QStringList indexes = {
        "CREATE INDEX IF NOT EXISTS idx_songs_album_id ON songs(album_id)",
        "CREATE INDEX IF NOT EXISTS idx_songs_artist_id ON songs(artist_id)",
        "CREATE INDEX IF NOT EXISTS idx_songs_parent_directory ON songs(parent_directory)",
        "CREATE INDEX IF NOT EXISTS idx_cross_ref_artist_id ON song_artist_cross_ref(artist_id)",
        "CREATE INDEX IF NOT EXISTS idx_artists_name ON artists(name COLLATE NOCASE)",
        "CREATE INDEX IF NOT EXISTS idx_albums_artist_id ON albums(artist_id)"
    };

    for (const QString& statement : indexes) {
        if (!query.exec(statement)) {
            logError("Create index", query);
            return false;
        }
    }
    return true;
}

QString DatabaseManager::defaultDatabasePath() const
{
    QString dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(dataPath).filePath("songbook_library.db");
}

QString DatabaseManager::threadConnectionName() const
{
    return QString("%1_Thread_%2")
        .arg(m_connectionName)
        .arg(quintptr(QThread::currentThreadId()));
}

QSqlDatabase DatabaseManager::database()
{
    if (QThread::currentThread() == thread()) {
        return m_db;
    }

    // QSqlDatabase connections are bound to the thread that opened them
    const QString connectionName = threadConnectionName();

    QMutexLocker locker(&m_databaseMutex);
    if (QSqlDatabase::contains(connectionName)) {
        QSqlDatabase db = QSqlDatabase::database(connectionName, false);
        if (db.isOpen() && db.databaseName() == m_dbPath) {
            return db;
        }
        // Left behind by a finished thread that had the same id
        db = QSqlDatabase();
        removeThreadConnection(connectionName);
    }

    QSqlDatabase db = createThreadConnection(connectionName, m_dbPath);
    m_threadConnections.insert(connectionName);
    return db;
}

void DatabaseManager::releaseThreadConnection()
{
    if (QThread::currentThread() == thread()) {
        return;
    }

    const QString connectionName = threadConnectionName();
    QMutexLocker locker(&m_databaseMutex);
    if (!m_threadConnections.remove(connectionName)) {
        return;
    }
    removeThreadConnection(connectionName);
    qDebug() << "DatabaseManager: Released thread connection:" << connectionName;
}

std::optional<AudioMeta> DatabaseManager::getAudioMetadataById(qint64 songId)
{
    QSqlDatabase db = database();
    if (!db.isOpen()) {
        return std::nullopt;
    }

    QSqlQuery query(db);
    query.prepare("SELECT mime_type, bitrate, sample_rate FROM songs WHERE id = ?");
    query.addBindValue(songId);
    if (!query.exec()) {
        logError("getAudioMetadataById", query);
        return std::nullopt;
    }
    if (!query.next()) {
        return std::nullopt;
    }

    AudioMeta meta;
    meta.mimeType = query.value(0).toString();
    meta.bitrate = optionalInt(query.value(1));
    meta.sampleRate = optionalInt(query.value(2));
    return meta;
}

Song DatabaseManager::songFromQuery(const QSqlQuery& query)
{
    Song song;
    song.id = query.value("id").toLongLong();
    song.title = query.value("title").toString();
    song.artistName = query.value("artist_name").toString();
    song.artistId = query.value("artist_id").toLongLong();
    song.albumArtist = query.value("album_artist").toString();
    song.albumName = query.value("album_name").toString();
    song.albumId = query.value("album_id").toLongLong();
    song.filePath = query.value("file_path").toString();
    song.parentDirectory = query.value("parent_directory").toString();
    song.durationMs = query.value("duration_ms").toLongLong();
    song.trackNumber = query.value("track_number").toInt();
    song.year = query.value("year").toInt();
    song.genre = query.value("genre").toString();
    song.mimeType = query.value("mime_type").toString();
    song.bitrate = optionalInt(query.value("bitrate"));
    song.sampleRate = optionalInt(query.value("sample_rate"));
    song.albumArtUri = query.value("album_art_uri").toString();
    song.dateModified = query.value("date_modified").toLongLong();
    return song;
}

std::optional<Song> DatabaseManager::songById(qint64 songId)
{
    QSqlDatabase db = database();
    if (!db.isOpen()) {
        return std::nullopt;
    }

    QSqlQuery query(db);
    query.prepare(QString("SELECT %1 FROM songs WHERE id = ?").arg(SONG_COLUMNS.join(", ")));
    query.addBindValue(songId);
    if (!query.exec()) {
        logError("songById", query);
        return std::nullopt;
    }
    if (!query.next()) {
        return std::nullopt;
    }
    return songFromQuery(query);
}

Album DatabaseManager::albumFromQuery(const QSqlQuery& query)
{
    Album album;
    album.id = query.value("id").toLongLong();
    album.title = query.value("title").toString();
    album.artistName = query.value("artist_name").toString();
    album.artistId = query.value("artist_id").toLongLong();
    album.year = query.value("year").toInt();
    album.songCount = query.value("song_count").toInt();
    album.albumArtUri = query.value("album_art_uri").toString();
    return album;
}

std::optional<Album> DatabaseManager::albumById(qint64 albumId)
{
    QSqlDatabase db = database();
    if (!db.isOpen()) {
        return std::nullopt;
    }

    QSqlQuery query(db);
    query.prepare(QString("SELECT %1 FROM albums WHERE id = ?").arg(ALBUM_COLUMNS.join(", ")));
    query.addBindValue(albumId);
    if (!query.exec()) {
        logError("albumById", query);
        return std::nullopt;
    }
    if (!query.next()) {
        return std::nullopt;
    }
    return albumFromQuery(query);
}

bool DatabaseManager::songsByIds(const QList<qint64>& songIds, QHash<qint64, Song>& songs)
{
    songs.clear();
    QSqlDatabase db = database();
    if (!db.isOpen()) {
        setLastError("Database error in songsByIds: database is not open");
        return false;
    }

    songs.reserve(songIds.size());
    const int chunkSize = maxBoundParameters();
    for (qsizetype start = 0; start < songIds.size(); start += chunkSize) {
        const QList<qint64> chunk = songIds.mid(start, chunkSize);

        QSqlQuery query(db);
        query.prepare(QString("SELECT %1 FROM songs WHERE id IN (%2)")
                      .arg(SONG_COLUMNS.join(", "), placeholders(chunk.size())));
        for (qint64 id : chunk) {
            query.addBindValue(id);
        }
        if (!query.exec()) {
            logError("songsByIds", query);
            songs.clear();
            return false;
        }
        while (query.next()) {
            Song song = songFromQuery(query);
            songs.insert(song.id, song);
        }
    }
    return true;
}

bool DatabaseManager::allArtists(QList<Artist>& artists)
{
    artists.clear();
    QSqlDatabase db = database();
    if (!db.isOpen()) {
        setLastError("Database error in allArtists: database is not open");
        return false;
    }

    QSqlQuery query(db);
    if (!query.exec("SELECT id, name FROM artists ORDER BY id")) {
        logError("allArtists", query);
        return false;
    }
    while (query.next()) {
        Artist artist;
        artist.id = query.value(0).toLongLong();
        artist.name = query.value(1).toString();
        artists.append(artist);
    }
    return true;
}

bool DatabaseManager::allAlbums(QList<Album>& albums)
{
    albums.clear();
    QSqlDatabase db = database();
    if (!db.isOpen()) {
        setLastError("Database error in allAlbums: database is not open");
        return false;
    }

    QSqlQuery query(db);
    if (!query.exec(QString("SELECT %1 FROM albums ORDER BY id").arg(ALBUM_COLUMNS.join(", ")))) {
        logError("allAlbums", query);
        return false;
    }
    while (query.next()) {
        albums.append(albumFromQuery(query));
    }
    return true;
}

QList<SongArtistCrossRef> DatabaseManager::crossRefsForSong(qint64 songId)
{
    QList<SongArtistCrossRef> crossRefs;
    QSqlDatabase db = database();
    if (!db.isOpen()) {
        return crossRefs;
    }

    QSqlQuery query(db);
    query.prepare("SELECT song_id, artist_id, is_primary FROM song_artist_cross_ref "
                  "WHERE song_id = ? ORDER BY is_primary DESC, artist_id");
    query.addBindValue(songId);
    if (!query.exec()) {
        logError("crossRefsForSong", query);
        return crossRefs;
    }
    while (query.next()) {
        SongArtistCrossRef crossRef;
        crossRef.songId = query.value(0).toLongLong();
        crossRef.artistId = query.value(1).toLongLong();
        crossRef.isPrimary = query.value(2).toBool();
        crossRefs.append(crossRef);
    }
    return crossRefs;
}

bool DatabaseManager::execBatch(const QString& operation, const QString& statement,
                                const QStringList& columns, int rowCount, const QVariantList& values)
{
    if (rowCount == 0) {
        return true;
    }

    if (values.size() > maxBoundParameters()) {
        const QString error = QString("Database error in %1: %2 bound values exceed the limit of %3")
            .arg(operation).arg(values.size()).arg(maxBoundParameters());
        qCritical() << "DatabaseManager:" << error;
        setLastError(error);
        emit databaseError(error);
        return false;
    }

    QSqlDatabase db = database();
    if (!db.isOpen()) {
        setLastError(QString("Database error in %1: database is not open").arg(operation));
        return false;
    }

    const QString row = "(" + placeholders(columns.size()) + ")";
    const QString sql = QString("%1 (%2) VALUES %3")
        .arg(statement, columns.join(", "), QStringList(rowCount, row).join(", "));

    QSqlQuery query(db);
    if (!query.prepare(sql)) {
        logError(operation, query);
        return false;
    }
    for (const QVariant& value : values) {
        query.addBindValue(value);
    }
    if (!query.exec()) {
        logError(operation, query);
        return false;
    }
    return true;
}

bool DatabaseManager::insertArtists(const QList<Artist>& artists)
{
    QVariantList values;
    values.reserve(artists.size() * Artist::FieldCount);
    for (const Artist& artist : artists) {
        values << artist.id << artist.name;
    }
    return execBatch("insertArtists", "INSERT OR REPLACE INTO artists", ARTIST_COLUMNS,
                     artists.size(), values);
}

bool DatabaseManager::insertAlbums(const QList<Album>& albums)
{
    QVariantList values;
    values.reserve(albums.size() * Album::FieldCount);
    for (const Album& album : albums) {
        values << album.id << album.title << album.artistName << album.artistId
               << album.year << album.songCount << nullable(album.albumArtUri);
    }
    return execBatch("insertAlbums", "INSERT OR REPLACE INTO albums", ALBUM_COLUMNS,
                     albums.size(), values);
}

bool DatabaseManager::insertSongs(const QList<Song>& songs)
{
    QVariantList values;
    values.reserve(songs.size() * Song::FieldCount);
    for (const Song& song : songs) {
        values << song.id << song.title << song.artistName << song.artistId
               << song.albumArtist << song.albumName << song.albumId
               << song.filePath << song.parentDirectory << song.durationMs
               << song.trackNumber << song.year << song.genre
               << nullable(song.mimeType) << nullable(song.bitrate) << nullable(song.sampleRate)
               << nullable(song.albumArtUri) << song.dateModified;
    }
    return execBatch("insertSongs", "INSERT OR REPLACE INTO songs", SONG_COLUMNS,
                     songs.size(), values);
}

bool DatabaseManager::insertCrossRefs(const QList<SongArtistCrossRef>& crossRefs)
{
    QVariantList values;
    values.reserve(crossRefs.size() * SongArtistCrossRef::FieldCount);
    for (const SongArtistCrossRef& crossRef : crossRefs) {
        values << crossRef.songId << crossRef.artistId << (crossRef.isPrimary ? 1 : 0);
    }
    return execBatch("insertCrossRefs", "INSERT OR IGNORE INTO song_artist_cross_ref",
                     CROSS_REF_COLUMNS, crossRefs.size(), values);
}

bool DatabaseManager::fillKeepTable(QSqlDatabase& db, const QList<qint64>& songIds)
{
    QSqlQuery query(db);
    if (!query.exec("CREATE TEMP TABLE IF NOT EXISTS sync_keep (id INTEGER PRIMARY KEY)")) {
        logError("deleteSongsExcept - create keep table", query);
        return false;
    }
    if (!query.exec("DELETE FROM sync_keep")) {
        logError("deleteSongsExcept - clear keep table", query);
        return false;
    }

    const int chunkSize = maxBoundParameters();
    for (qsizetype start = 0; start < songIds.size(); start += chunkSize) {
        const QList<qint64> chunk = songIds.mid(start, chunkSize);

        QSqlQuery insert(db);
        insert.prepare("INSERT OR IGNORE INTO sync_keep (id) VALUES "
                       + QStringList(chunk.size(), QStringLiteral("(?)")).join(", "));
        for (qint64 id : chunk) {
            insert.addBindValue(id);
        }
        if (!insert.exec()) {
            logError("deleteSongsExcept - fill keep table", insert);
            return false;
        }
    }
    return true;
}

bool DatabaseManager::deleteSongsExcept(const QList<qint64>& songIds)
{
    QSqlDatabase db = database();
    if (!db.isOpen()) {
        setLastError("Database error in deleteSongsExcept: database is not open");
        return false;
    }

    if (!fillKeepTable(db, songIds)) {
        return false;
    }

    QSqlQuery query(db);
    if (!query.exec("DELETE FROM songs WHERE id NOT IN (SELECT id FROM sync_keep)")) {
        logError("deleteSongsExcept - delete songs", query);
        return false;
    }

    int deletedSongs = query.numRowsAffected();
    if (deletedSongs > 0) {
        qDebug() << "DatabaseManager: Deleted" << deletedSongs << "songs no longer in the library";
    }

    if (!query.exec("DELETE FROM song_artist_cross_ref WHERE song_id NOT IN (SELECT id FROM songs)")) {
        logError("deleteSongsExcept - delete cross references", query);
        return false;
    }

    query.exec("DELETE FROM sync_keep");
    return true;
}

bool DatabaseManager::deleteAllCrossRefs()
{
    QSqlDatabase db = database();
    QSqlQuery query(db);
    if (!query.exec("DELETE FROM song_artist_cross_ref")) {
        logError("deleteAllCrossRefs", query);
        return false;
    }
    return true;
}

bool DatabaseManager::deleteOrphans()
{
    QSqlDatabase db = database();
    QSqlQuery query(db);

    if (!query.exec("DELETE FROM albums WHERE id NOT IN (SELECT DISTINCT album_id FROM songs WHERE album_id IS NOT NULL)")) {
        logError("deleteOrphans - delete orphaned albums", query);
        return false;
    }

    int deletedAlbums = query.numRowsAffected();
    if (deletedAlbums > 0) {
        qDebug() << "DatabaseManager: Deleted" << deletedAlbums << "orphaned albums";
    }

    if (!query.exec("DELETE FROM artists WHERE id NOT IN (SELECT DISTINCT artist_id FROM song_artist_cross_ref) "
                    "AND id NOT IN (SELECT DISTINCT artist_id FROM albums WHERE artist_id IS NOT NULL)")) {
        logError("deleteOrphans - delete orphaned artists", query);
        return false;
    }

    int deletedArtists = query.numRowsAffected();
    if (deletedArtists > 0) {
        qDebug() << "DatabaseManager: Deleted" << deletedArtists << "orphaned artists";
    }

    return true;
}

int DatabaseManager::countRows(const QString& table)
{
    QSqlDatabase db = database();
    if (!db.isOpen()) return 0;

    QSqlQuery query(db);
    if (!query.exec(QString("SELECT COUNT(*) FROM %1").arg(table))) {
        logError("countRows", query);
        return 0;
    }
    return query.next() ? query.value(0).toInt() : 0;
}

int DatabaseManager::songCount()
{
    return countRows("songs");
}

int DatabaseManager::albumCount()
{
    return countRows("albums");
}

int DatabaseManager::artistCount()
{
    return countRows("artists");
}

int DatabaseManager::crossRefCount()
{
    return countRows("song_artist_cross_ref");
}

QHash<QString, int> DatabaseManager::mimeTypeCounts()
{
    QHash<QString, int> counts;
    QSqlDatabase db = database();
    if (!db.isOpen()) return counts;

    QSqlQuery query(db);
    if (!query.exec("SELECT mime_type, COUNT(*) FROM songs GROUP BY mime_type")) {
        logError("mimeTypeCounts", query);
        return counts;
    }
    while (query.next()) {
        counts[query.value(0).toString()] += query.value(1).toInt();
    }
    return counts;
}

bool DatabaseManager::beginTransaction()
{
    QSqlDatabase db = database();
    if (!db.transaction()) {
        setLastError(QString("Database error in beginTransaction: %1").arg(db.lastError().text()));
        return false;
    }
    return true;
}

bool DatabaseManager::commitTransaction()
{
    QSqlDatabase db = database();
    if (!db.commit()) {
        setLastError(QString("Database error in commitTransaction: %1").arg(db.lastError().text()));
        return false;
    }
    return true;
}

bool DatabaseManager::rollbackTransaction()
{
    QSqlDatabase db = database();
    return db.rollback();
}

QString DatabaseManager::lastError() const
{
    QMutexLocker locker(&m_databaseMutex);
    return m_lastError;
}

void DatabaseManager::setLastError(const QString& error)
{
    QMutexLocker locker(&m_databaseMutex);
    m_lastError = error;
}

QSqlDatabase DatabaseManager::createThreadConnection(const QString& connectionName, const QString& dbPath)
{
    QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", connectionName);
    db.setDatabaseName(dbPath);

    if (!db.open()) {
        qCritical() << "DatabaseManager: Failed to open thread database connection:" << db.lastError().text();
        return db;
    }

    QSqlQuery query(db);
    query.exec("PRAGMA journal_mode = WAL");
    query.exec("PRAGMA synchronous = NORMAL");
    query.exec("PRAGMA temp_store = MEMORY");
    query.exec("PRAGMA busy_timeout = 5000");

    qDebug() << "DatabaseManager: Created thread connection:" << connectionName;
    return db;
}

void DatabaseManager::removeThreadConnection(const QString& connectionName)
{
    {
        QSqlDatabase db = QSqlDatabase::database(connectionName, false);
        if (db.isValid() && db.isOpen()) {
            db.close();
        }
    }
    QSqlDatabase::removeDatabase(connectionName);
}

void DatabaseManager::logError(const QString& operation, const QSqlQuery& query)
{
    QString error = QString("Database error in %1: %2").arg(operation, query.lastError().text());
    qCritical() << "DatabaseManager:" << error;
    qCritical() << "DatabaseManager: SQL:" << query.lastQuery();
    setLastError(error);
    emit databaseError(error);
}

} // namespace Songbook
