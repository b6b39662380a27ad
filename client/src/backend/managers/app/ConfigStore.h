#ifndef CONFIGSTORE_H
#define CONFIGSTORE_H

#include <QString>

struct DeviceConfig {
    QString lastIdentity;
    QString lastAddress;

    bool isEmpty() const { return lastIdentity.isEmpty() && lastAddress.isEmpty(); }
};

// Best-effort persistence of the last device the user connected to.
class ConfigStore {
public:
    virtual ~ConfigStore() = default;

    virtual DeviceConfig load() = 0;
    // false when the record could not be written; callers log and carry on
    virtual bool save(const DeviceConfig& config) = 0;
};

#endif // CONFIGSTORE_H
