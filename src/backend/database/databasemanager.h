#ifndef DATABASEMANAGER_H
#define DATABASEMANAGER_H

#include <QObject>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QString>
#include <QSet>
#include <QMutex>
#include <QVariant>

#include "librarystore.h"

namespace Songbook {

class DatabaseManager : public QObject, public LibraryStore
{
    Q_OBJECT
public:
    explicit DatabaseManager(QObject *parent = nullptr);
    ~DatabaseManager();

    // Database initialization
    bool initializeDatabase(const QString& dbPath = QString());
    bool isOpen() const;
    void close();
    QString databasePath() const { return m_dbPath; }

    // Lookups
    std::optional<AudioMeta> getAudioMetadataById(qint64 songId) override;
    std::optional<Song> songById(qint64 songId) override;
    std::optional<Album> albumById(qint64 albumId) override;
    bool songsByIds(const QList<qint64>& songIds, QHash<qint64, Song>& songs) override;
    bool allArtists(QList<Artist>& artists) override;
    bool allAlbums(QList<Album>& albums) override;
    QList<SongArtistCrossRef> crossRefsForSong(qint64 songId);

    // Batch writes, one statement per call
    bool insertArtists(const QList<Artist>& artists) override;
    bool insertAlbums(const QList<Album>& albums) override;
    bool insertSongs(const QList<Song>& songs) override;
    bool insertCrossRefs(const QList<SongArtistCrossRef>& crossRefs) override;

    // Library management
    bool deleteSongsExcept(const QList<qint64>& songIds) override;
    bool deleteAllCrossRefs() override;
    bool deleteOrphans() override;

    int songCount();
    int albumCount();
    int artistCount();
    int crossRefCount();
    // Songs per stored mime type; songs without one are counted under an empty key
    QHash<QString, int> mimeTypeCounts();

    // Batch operations
    bool beginTransaction() override;
    bool commitTransaction() override;
    bool rollbackTransaction() override;

    QString lastError() const override;

    // Thread-safe operations
    void releaseThreadConnection() override;
    static QSqlDatabase createThreadConnection(const QString& connectionName, const QString& dbPath);
    static void removeThreadConnection(const QString& connectionName);

    static constexpr int CURRENT_SCHEMA_VERSION = 1;

signals:
    void databaseError(const QString& error);

private:
    bool createTables();
    bool createIndexes();
    QString defaultDatabasePath() const;
    QSqlDatabase database();
    QString threadConnectionName() const;
    int countRows(const QString& table);
    bool execBatch(const QString& operation, const QString& table, const QStringList& columns,
                   int rowCount, const QVariantList& values);
    bool fillKeepTable(QSqlDatabase& db, const QList<qint64>& songIds);
    void logError(const QString& operation, const QSqlQuery& query);
    void setLastError(const QString& error);

    static Song songFromQuery(const QSqlQuery& query);
    static Album albumFromQuery(const QSqlQuery& query);

    QSqlDatabase m_db;
    QString m_dbPath;
    QString m_connectionName;

    mutable QMutex m_databaseMutex;
    QSet<QString> m_threadConnections;
    QString m_lastError;
};

} // namespace Songbook

#endif // DATABASEMANAGER_H
