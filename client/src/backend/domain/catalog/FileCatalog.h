#ifndef FILECATALOG_H
#define FILECATALOG_H

#include <QString>
#include <QStringList>
#include <QHash>
#include <QList>
#include "backend/domain/models/DeviceTypes.h"

struct ChangeMarker {
    QString fileName;
    int remainingTicks = 0;
};

/**
 * FileCatalog
 *
 * Latest file listing reported by the device plus the "recently changed"
 * markers overlaying it. The listing itself is never edited in place: a
 * refresh builds a new catalog through withFiles(), which carries over the
 * markers of files that are still listed. Markers count down through
 * tickMarkers(), one call per decay interval.
 */
class FileCatalog {
public:
    static constexpr int DEFAULT_MARKER_TICKS = 15;

    FileCatalog() = default;
    explicit FileCatalog(const QList<RemoteFile>& files);

    const QList<RemoteFile>& files() const { return m_files; }
    int size() const { return m_files.size(); }
    bool isEmpty() const { return m_files.isEmpty(); }
    bool contains(const QString& name) const;
    QStringList fileNames() const;

    // Replacement catalog for a new listing; markers of vanished files are dropped
    FileCatalog withFiles(const QList<RemoteFile>& files) const;

    // Inserts or resets a marker for every listed name; returns the names actually marked
    QStringList markChanged(const QStringList& names, int ticks = DEFAULT_MARKER_TICKS);

    // One decay step; returns the names whose marker expired on this tick
    QStringList tickMarkers();

    bool hasMarker(const QString& name) const { return m_markers.contains(name); }
    bool hasActiveMarkers() const { return !m_markers.isEmpty(); }
    int remainingTicks(const QString& name) const;
    QList<ChangeMarker> markers() const;
    QHash<QString, int> markerCountdowns() const;

    void clear();

private:
    QList<RemoteFile> m_files;
    QHash<QString, ChangeMarker> m_markers; // fileName -> marker
};

#endif // FILECATALOG_H
