#include "backend/domain/catalog/FileCatalog.h"
#include <QDebug>
#include <algorithm>

FileCatalog::FileCatalog(const QList<RemoteFile>& files)
    : m_files(files)
{
}

bool FileCatalog::contains(const QString& name) const {
    return std::any_of(m_files.cbegin(), m_files.cend(),
                       [&name](const RemoteFile& file) { return file.name == name; });
}

QStringList FileCatalog::fileNames() const {
    QStringList names;
    names.reserve(m_files.size());
    for (const RemoteFile& file : m_files) {
        names.append(file.name);
    }
    return names;
}

FileCatalog FileCatalog::withFiles(const QList<RemoteFile>& files) const {
    FileCatalog next(files);
    for (auto it = m_markers.cbegin(); it != m_markers.cend(); ++it) {
        if (next.contains(it.key())) {
            next.m_markers.insert(it.key(), it.value());
        } else {
            qDebug() << "FileCatalog: Dropping marker for" << it.key() << "(no longer listed)";
        }
    }
    return next;
}

QStringList FileCatalog::markChanged(const QStringList& names, int ticks) {
    QStringList marked;
    if (ticks <= 0) {
        return marked;
    }
    for (const QString& name : names) {
        if (!contains(name)) {
            qDebug() << "FileCatalog: Not marking" << name << "- not in the current listing";
            continue;
        }
        m_markers.insert(name, ChangeMarker{name, ticks});
        if (!marked.contains(name)) {
            marked.append(name);
        }
    }
    return marked;
}

QStringList FileCatalog::tickMarkers() {
    QStringList expired;
    for (auto it = m_markers.begin(); it != m_markers.end(); ) {
        if (--it.value().remainingTicks <= 0) {
            expired.append(it.key());
            it = m_markers.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

int FileCatalog::remainingTicks(const QString& name) const {
    const auto it = m_markers.constFind(name);
    return it == m_markers.cend() ? 0 : it.value().remainingTicks;
}

QList<ChangeMarker> FileCatalog::markers() const {
    QList<ChangeMarker> result;
    // Listing order, so consumers see a stable sequence
    for (const RemoteFile& file : m_files) {
        const auto it = m_markers.constFind(file.name);
        if (it != m_markers.cend()) {
            result.append(it.value());
        }
    }
    return result;
}

QHash<QString, int> FileCatalog::markerCountdowns() const {
    QHash<QString, int> countdowns;
    for (auto it = m_markers.cbegin(); it != m_markers.cend(); ++it) {
        countdowns.insert(it.key(), it.value().remainingTicks);
    }
    return countdowns;
}

void FileCatalog::clear() {
    m_files.clear();
    m_markers.clear();
}
