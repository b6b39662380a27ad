#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QObject>
#include <QString>
#include <memory>
#include "backend/managers/app/ConfigStore.h"
#include "backend/domain/session/SessionTypes.h"

class QSettings;

/**
 * SettingsManager
 * Application settings persistence on QSettings.
 * Handles:
 * - Last connected device (identity + address), used for auto-connect on launch
 * - Session tuning (port, remote folder, timeouts, keepalive and highlight cadence)
 *
 * Uses the native QSettings location by default, or an INI file when a path is given.
 */
class SettingsManager : public QObject, public ConfigStore {
    Q_OBJECT

public:
    explicit SettingsManager(QObject* parent = nullptr);
    explicit SettingsManager(const QString& iniFilePath, QObject* parent = nullptr);
    ~SettingsManager() override = default;

    // Settings persistence
    void loadSettings();
    bool saveSettings();

    // ConfigStore
    DeviceConfig load() override;
    bool save(const DeviceConfig& config) override;

    // Getters
    QString getLastAddress() const { return m_deviceConfig.lastAddress; }
    QString getLastIdentity() const { return m_deviceConfig.lastIdentity; }
    SessionOptions getSessionOptions() const { return m_sessionOptions; }

    // Setters
    void setSessionOptions(const SessionOptions& options);

signals:
    void settingsChanged();
    void deviceConfigSaved(const QString& identity, const QString& address);

private:
    std::unique_ptr<QSettings> openSettings() const;

    QString m_iniFilePath;
    DeviceConfig m_deviceConfig;
    SessionOptions m_sessionOptions;
};

#endif // SETTINGSMANAGER_H
