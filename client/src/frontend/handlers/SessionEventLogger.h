#ifndef SESSIONEVENTLOGGER_H
#define SESSIONEVENTLOGGER_H

#include <QObject>
#include <QString>

class SessionManager;

/**
 * @brief Headless consumer of the SessionManager event stream
 *
 * Subscribes to every session event and writes it to the application log.
 * Stands in for the window when the connector runs without a GUI.
 */
class SessionEventLogger : public QObject
{
    Q_OBJECT

public:
    explicit SessionEventLogger(QObject* parent = nullptr);

    /**
     * @brief Connect all session signals to the logger
     * @param sessionManager The SessionManager to observe
     *
     * Idempotent: a second call for the same manager does nothing.
     */
    void attach(SessionManager* sessionManager);

    int heartbeatCount() const { return m_heartbeatCount; }

private:
    SessionManager* m_sessionManager = nullptr;
    int m_heartbeatCount = 0;
};

#endif // SESSIONEVENTLOGGER_H
