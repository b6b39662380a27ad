#include "backend/managers/app/SettingsManager.h"
#include <QSettings>
#include <QDebug>

namespace {
    const QString ORGANIZATION_NAME = QStringLiteral("LaserLink");
    const QString APPLICATION_NAME = QStringLiteral("Connector");

    const QString KEY_LAST_IDENTITY = QStringLiteral("lastIdentity");
    const QString KEY_LAST_ADDRESS = QStringLiteral("lastAddress");
    const QString GROUP_SESSION = QStringLiteral("session");

    int positiveOr(int value, int fallback) {
        return value > 0 ? value : fallback;
    }
}

SettingsManager::SettingsManager(QObject* parent)
    : QObject(parent)
{
}

SettingsManager::SettingsManager(const QString& iniFilePath, QObject* parent)
    : QObject(parent)
    , m_iniFilePath(iniFilePath)
{
}

std::unique_ptr<QSettings> SettingsManager::openSettings() const {
    if (!m_iniFilePath.isEmpty()) {
        return std::make_unique<QSettings>(m_iniFilePath, QSettings::IniFormat);
    }
    return std::make_unique<QSettings>(ORGANIZATION_NAME, APPLICATION_NAME);
}

void SettingsManager::loadSettings() {
    m_deviceConfig = load();

    auto settings = openSettings();
    const SessionOptions defaults;
    settings->beginGroup(GROUP_SESSION);
    const int port = settings->value("port", defaults.port).toInt();
    m_sessionOptions.port = (port > 0 && port <= 65535) ? static_cast<quint16>(port) : defaults.port;
    m_sessionOptions.remotePath = settings->value("remotePath", defaults.remotePath).toString();
    if (m_sessionOptions.remotePath.isEmpty()) m_sessionOptions.remotePath = defaults.remotePath;
    m_sessionOptions.controlTimeoutMs = positiveOr(settings->value("controlTimeoutMs", defaults.controlTimeoutMs).toInt(), defaults.controlTimeoutMs);
    m_sessionOptions.uploadTimeoutMs = positiveOr(settings->value("uploadTimeoutMs", defaults.uploadTimeoutMs).toInt(), defaults.uploadTimeoutMs);
    m_sessionOptions.keepaliveIntervalMs = positiveOr(settings->value("keepaliveIntervalMs", defaults.keepaliveIntervalMs).toInt(), defaults.keepaliveIntervalMs);
    m_sessionOptions.markerTicks = positiveOr(settings->value("markerTicks", defaults.markerTicks).toInt(), defaults.markerTicks);
    m_sessionOptions.markerTickMs = positiveOr(settings->value("markerTickMs", defaults.markerTickMs).toInt(), defaults.markerTickMs);
    settings->endGroup();

    qDebug() << "SettingsManager: Settings loaded - last address:" << m_deviceConfig.lastAddress
             << "identity:" << m_deviceConfig.lastIdentity
             << "port:" << m_sessionOptions.port;
}

bool SettingsManager::saveSettings() {
    auto settings = openSettings();
    settings->beginGroup(GROUP_SESSION);
    settings->setValue("port", m_sessionOptions.port);
    settings->setValue("remotePath", m_sessionOptions.remotePath);
    settings->setValue("controlTimeoutMs", m_sessionOptions.controlTimeoutMs);
    settings->setValue("uploadTimeoutMs", m_sessionOptions.uploadTimeoutMs);
    settings->setValue("keepaliveIntervalMs", m_sessionOptions.keepaliveIntervalMs);
    settings->setValue("markerTicks", m_sessionOptions.markerTicks);
    settings->setValue("markerTickMs", m_sessionOptions.markerTickMs);
    settings->endGroup();
    settings->sync();

    if (settings->status() != QSettings::NoError) {
        qWarning() << "SettingsManager: Failed to save settings to" << settings->fileName();
        return false;
    }
    qDebug() << "SettingsManager: Settings saved";
    emit settingsChanged();
    return true;
}

DeviceConfig SettingsManager::load() {
    auto settings = openSettings();
    if (settings->status() != QSettings::NoError) {
        qWarning() << "SettingsManager: Failed to read" << settings->fileName();
        return DeviceConfig();
    }
    DeviceConfig config;
    config.lastIdentity = settings->value(KEY_LAST_IDENTITY).toString();
    config.lastAddress = settings->value(KEY_LAST_ADDRESS).toString().trimmed();
    return config;
}

bool SettingsManager::save(const DeviceConfig& config) {
    auto settings = openSettings();
    settings->setValue(KEY_LAST_IDENTITY, config.lastIdentity);
    settings->setValue(KEY_LAST_ADDRESS, config.lastAddress);
    settings->sync();

    if (settings->status() != QSettings::NoError) {
        qWarning() << "SettingsManager: Failed to save device config to" << settings->fileName();
        return false;
    }

    m_deviceConfig = config;
    qDebug() << "SettingsManager: Device config saved - identity:" << config.lastIdentity
             << "address:" << config.lastAddress;
    emit deviceConfigSaved(config.lastIdentity, config.lastAddress);
    return true;
}

void SettingsManager::setSessionOptions(const SessionOptions& options) {
    m_sessionOptions = options;
    saveSettings();
}
