#include <QCoreApplication>
#include <QTimer>
#include <QDebug>
#include <csignal>
#include <memory>
#include "backend/domain/session/SessionManager.h"
#include "backend/managers/app/SettingsManager.h"
#include "backend/network/HttpDeviceTransport.h"
#include "frontend/handlers/SessionEventLogger.h"

namespace {
volatile std::sig_atomic_t g_stopRequested = 0;

void requestStop(int) {
    g_stopRequested = 1;
}
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("LaserLink");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("LaserLink");

    SettingsManager settings;
    settings.loadSettings();

    SessionManager sessionManager(std::make_shared<HttpDeviceTransport>(), &settings);
    sessionManager.setOptions(settings.getSessionOptions());

    SessionEventLogger eventLogger;
    eventLogger.attach(&sessionManager);

    // Signal handlers only set a flag; the event loop polls it
    std::signal(SIGINT, requestStop);
    std::signal(SIGTERM, requestStop);
    QTimer stopPoll;
    QObject::connect(&stopPoll, &QTimer::timeout, &app, []() {
        if (g_stopRequested) QCoreApplication::quit();
    });
    stopPoll.start(200);

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&sessionManager]() { sessionManager.shutdown(); });

    // Reconnect to the last device, if any
    const QString lastAddress = settings.getLastAddress();
    if (!lastAddress.isEmpty()) {
        qInfo() << "Auto-connecting to last device" << lastAddress << "(" << settings.getLastIdentity() << ")";
        QTimer::singleShot(0, &sessionManager, [&sessionManager, lastAddress]() {
            sessionManager.connectToDevice(lastAddress);
        });
    } else {
        qInfo() << "No device configured yet; set lastAddress in the LaserLink settings";
    }

    return app.exec();
}
