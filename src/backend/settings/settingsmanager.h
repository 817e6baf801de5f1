#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <memory>

namespace Songbook {

// Immutable view of the library preferences, taken once at the start of a sync.
struct SyncPreferences {
    QStringList musicFolders;
    QStringList blockedDirectories;
    QStringList allowedDirectories;
    bool deepScan = false;
    bool useArtistDelimiters = true;
    QStringList artistDelimiters;
};

class SettingsManager : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QStringList musicFolders READ musicFolders WRITE setMusicFolders NOTIFY musicFoldersChanged)
    Q_PROPERTY(QStringList blockedDirectories READ blockedDirectories WRITE setBlockedDirectories NOTIFY directoryRulesChanged)
    Q_PROPERTY(QStringList allowedDirectories READ allowedDirectories WRITE setAllowedDirectories NOTIFY directoryRulesChanged)
    Q_PROPERTY(bool deepScan READ deepScan WRITE setDeepScan NOTIFY deepScanChanged)
    Q_PROPERTY(bool useArtistDelimiters READ useArtistDelimiters WRITE setUseArtistDelimiters NOTIFY useArtistDelimitersChanged)
    Q_PROPERTY(QStringList artistDelimiters READ artistDelimiters WRITE setArtistDelimiters NOTIFY artistDelimitersChanged)

public:
    // An empty path uses the platform's default settings location.
    explicit SettingsManager(const QString& settingsPath = QString(), QObject *parent = nullptr);
    ~SettingsManager();

    QStringList musicFolders() const { return m_musicFolders; }
    QStringList blockedDirectories() const { return m_blockedDirectories; }
    QStringList allowedDirectories() const { return m_allowedDirectories; }
    bool deepScan() const { return m_deepScan; }
    bool useArtistDelimiters() const { return m_useArtistDelimiters; }
    QStringList artistDelimiters() const { return m_artistDelimiters; }

    void setMusicFolders(const QStringList& folders);
    void setBlockedDirectories(const QStringList& directories);
    void setAllowedDirectories(const QStringList& directories);
    void setDeepScan(bool enabled);
    void setUseArtistDelimiters(bool enabled);
    void setArtistDelimiters(const QStringList& delimiters);

    bool addMusicFolder(const QString& folder);
    bool removeMusicFolder(const QString& folder);
    bool addBlockedDirectory(const QString& directory);
    bool removeBlockedDirectory(const QString& directory);
    bool addAllowedDirectory(const QString& directory);
    bool removeAllowedDirectory(const QString& directory);

    SyncPreferences snapshot() const;

    // False when the backing store could not be read or written.
    bool isValid() const;
    QString errorString() const;
    QString fileName() const;

    void sync();

    static QStringList defaultArtistDelimiters();

signals:
    void musicFoldersChanged(const QStringList& folders);
    void directoryRulesChanged();
    void deepScanChanged(bool enabled);
    void useArtistDelimitersChanged(bool enabled);
    void artistDelimitersChanged(const QStringList& delimiters);

private:
    void loadSettings();
    void saveSettings();

    static QStringList normalizedList(const QStringList& paths);
    static bool addPath(QStringList& list, const QString& path);
    static bool removePath(QStringList& list, const QString& path);

    std::unique_ptr<QSettings> m_settings;

    QStringList m_musicFolders;
    QStringList m_blockedDirectories;
    QStringList m_allowedDirectories;
    bool m_deepScan;
    bool m_useArtistDelimiters;
    QStringList m_artistDelimiters;
};

} // namespace Songbook

#endif // SETTINGSMANAGER_H
