#include "settingsmanager.h"
#include "../library/directoryrules.h"
#include <QDebug>

namespace Songbook {

SettingsManager::SettingsManager(const QString& settingsPath, QObject *parent)
    : QObject(parent)
    , m_settings(settingsPath.isEmpty()
                     ? std::make_unique<QSettings>("songbook", "songbook")
                     : std::make_unique<QSettings>(settingsPath, QSettings::IniFormat))
    , m_deepScan(false)
    , m_useArtistDelimiters(true)  // Multi-artist tags are split by default
    , m_artistDelimiters(defaultArtistDelimiters())
{
    loadSettings();
}

SettingsManager::~SettingsManager()
{
    saveSettings();
}

QStringList SettingsManager::defaultArtistDelimiters()
{
    return {";", "|", "/", "&"};
}

void SettingsManager::setMusicFolders(const QStringList& folders)
{
    const QStringList normalized = normalizedList(folders);
    if (m_musicFolders != normalized) {
        m_musicFolders = normalized;
        emit musicFoldersChanged(m_musicFolders);
        saveSettings();
    }
}

void SettingsManager::setBlockedDirectories(const QStringList& directories)
{
    const QStringList normalized = normalizedList(directories);
    if (m_blockedDirectories != normalized) {
        m_blockedDirectories = normalized;
        emit directoryRulesChanged();
        saveSettings();
    }
}

void SettingsManager::setAllowedDirectories(const QStringList& directories)
{
    const QStringList normalized = normalizedList(directories);
    if (m_allowedDirectories != normalized) {
        m_allowedDirectories = normalized;
        emit directoryRulesChanged();
        saveSettings();
    }
}

void SettingsManager::setDeepScan(bool enabled)
{
    if (m_deepScan != enabled) {
        m_deepScan = enabled;
        emit deepScanChanged(enabled);
        saveSettings();
    }
}

void SettingsManager::setUseArtistDelimiters(bool enabled)
{
    if (m_useArtistDelimiters != enabled) {
        m_useArtistDelimiters = enabled;
        emit useArtistDelimitersChanged(enabled);
        saveSettings();
    }
}

void SettingsManager::setArtistDelimiters(const QStringList& delimiters)
{
    QStringList cleaned;
    for (const QString& delimiter : delimiters) {
        if (!delimiter.trimmed().isEmpty() && !cleaned.contains(delimiter)) {
            cleaned.append(delimiter);
        }
    }

    if (m_artistDelimiters != cleaned) {
        m_artistDelimiters = cleaned;
        emit artistDelimitersChanged(cleaned);
        saveSettings();
    }
}

bool SettingsManager::addMusicFolder(const QString& folder)
{
    if (!addPath(m_musicFolders, folder)) {
        return false;
    }
    emit musicFoldersChanged(m_musicFolders);
    saveSettings();
    return true;
}

bool SettingsManager::removeMusicFolder(const QString& folder)
{
    if (!removePath(m_musicFolders, folder)) {
        return false;
    }
    emit musicFoldersChanged(m_musicFolders);
    saveSettings();
    return true;
}

bool SettingsManager::addBlockedDirectory(const QString& directory)
{
    if (!addPath(m_blockedDirectories, directory)) {
        return false;
    }
    emit directoryRulesChanged();
    saveSettings();
    return true;
}

bool SettingsManager::removeBlockedDirectory(const QString& directory)
{
    if (!removePath(m_blockedDirectories, directory)) {
        return false;
    }
    emit directoryRulesChanged();
    saveSettings();
    return true;
}

bool SettingsManager::addAllowedDirectory(const QString& directory)
{
    if (!addPath(m_allowedDirectories, directory)) {
        return false;
    }
    emit directoryRulesChanged();
    saveSettings();
    return true;
}

bool SettingsManager::removeAllowedDirectory(const QString& directory)
{
    if (!removePath(m_allowedDirectories, directory)) {
        return false;
    }
    emit directoryRulesChanged();
    saveSettings();
    return true;
}

SyncPreferences SettingsManager::snapshot() const
{
    SyncPreferences preferences;
    preferences.musicFolders = m_musicFolders;
    preferences.blockedDirectories = m_blockedDirectories;
    preferences.allowedDirectories = m_allowedDirectories;
    preferences.deepScan = m_deepScan;
    preferences.useArtistDelimiters = m_useArtistDelimiters;
    preferences.artistDelimiters = m_artistDelimiters;
    return preferences;
}

bool SettingsManager::isValid() const
{
    return m_settings->status() == QSettings::NoError;
}

QString SettingsManager::errorString() const
{
    switch (m_settings->status()) {
    case QSettings::NoError:
        return QString();
    case QSettings::AccessError:
        return QString("Settings file %1 cannot be accessed").arg(m_settings->fileName());
    case QSettings::FormatError:
        return QString("Settings file %1 is malformed").arg(m_settings->fileName());
    }
    return QString("Unknown settings error");
}

QString SettingsManager::fileName() const
{
    return m_settings->fileName();
}

void SettingsManager::sync()
{
    m_settings->sync();
    if (!isValid()) {
        qWarning() << "SettingsManager:" << errorString();
    }
}

void SettingsManager::loadSettings()
{
    if (!isValid()) {
        qWarning() << "SettingsManager:" << errorString();
    }

    m_settings->beginGroup("Library");
    m_musicFolders = normalizedList(m_settings->value("musicFolders").toStringList());
    m_blockedDirectories = normalizedList(m_settings->value("blockedDirectories").toStringList());
    m_allowedDirectories = normalizedList(m_settings->value("allowedDirectories").toStringList());
    m_deepScan = m_settings->value("deepScan", false).toBool();
    m_useArtistDelimiters = m_settings->value("useArtistDelimiters", true).toBool();
    m_artistDelimiters = m_settings->value("artistDelimiters", defaultArtistDelimiters()).toStringList();
    m_settings->endGroup();
}

void SettingsManager::saveSettings()
{
    // Never overwrite a file we failed to parse
    if (m_settings->status() == QSettings::FormatError) {
        return;
    }

    m_settings->beginGroup("Library");
    m_settings->setValue("musicFolders", m_musicFolders);
    m_settings->setValue("blockedDirectories", m_blockedDirectories);
    m_settings->setValue("allowedDirectories", m_allowedDirectories);
    m_settings->setValue("deepScan", m_deepScan);
    m_settings->setValue("useArtistDelimiters", m_useArtistDelimiters);
    m_settings->setValue("artistDelimiters", m_artistDelimiters);
    m_settings->endGroup();

    m_settings->sync();
}

QStringList SettingsManager::normalizedList(const QStringList& paths)
{
    QStringList result;
    for (const QString& path : paths) {
        addPath(result, path);
    }
    return result;
}

bool SettingsManager::addPath(QStringList& list, const QString& path)
{
    const QString normalized = DirectoryRules::normalizePath(path);
    if (normalized.isEmpty() || list.contains(normalized)) {
        return false;
    }
    list.append(normalized);
    return true;
}

bool SettingsManager::removePath(QStringList& list, const QString& path)
{
    return list.removeAll(DirectoryRules::normalizePath(path)) > 0;
}

} // namespace Songbook
