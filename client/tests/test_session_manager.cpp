// SessionManager tests. The fake device answers from the worker pool; results come
// back through the event loop, which the tests pump with waitUntil()/pumpEvents().
// FakeDeviceTransport::hold() freezes a request in flight so races can be staged.

#include "TestSupport.h"
#include "backend/domain/session/SessionManager.h"
#include "mocks/FakeDeviceTransport.h"
#include "mocks/MemoryConfigStore.h"
#include "frontend/handlers/SessionEventLogger.h"
#include <QTemporaryDir>

namespace {
const QString DEVICE_ADDRESS = QStringLiteral("192.168.1.101");
const QString OTHER_ADDRESS = QStringLiteral("192.168.1.102");
const QString IDENTITY_KEY = QStringLiteral("plain:[ESP420]");
const QString STATUS_KEY = QStringLiteral("plain:[ESP400]");

struct SessionFixture {
    std::shared_ptr<FakeDeviceTransport> transport = std::make_shared<FakeDeviceTransport>();
    MemoryConfigStore config;
    SessionManager manager{transport, &config};
    SessionEventRecorder events{manager};
    QTemporaryDir dir;

    explicit SessionFixture(const SessionOptions& options = testSessionOptions()) {
        manager.setOptions(options);
    }

    ~SessionFixture() {
        // Frozen requests would otherwise block the pool shutdown
        transport->releaseAll();
    }

    // Connects and waits for the initial listing to be applied
    bool connectAndSettle(const QString& address = DEVICE_ADDRESS) {
        manager.connectToDevice(address);
        return waitUntil([this]() { return manager.isConnected() && !manager.isRefreshInFlight(); });
    }

    bool settleRefresh() {
        return waitUntil([this]() { return !manager.isRefreshInFlight(); });
    }

    QString localFile(const QString& name, int size = 64) {
        return writeTempFile(dir.path(), name, QByteArray(size, 'G'));
    }
};
}

// ═══════════════════════════════════════════════════════════════════════════
// Connection lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SessionManager connects, persists the device and loads the catalog", "[session][connect]") {
    SessionFixture f;
    f.transport->setIdentityBody("FW version 1.2 # ESP3D\nSTA (AA:BB:CC:DD:EE:FF)\n");

    REQUIRE(f.connectAndSettle());

    REQUIRE(f.manager.connectionState() == ConnectionState::Connected);
    REQUIRE(f.manager.session().deviceAddress == DEVICE_ADDRESS);
    REQUIRE(f.manager.session().identity.hardwareAddress == "AA:BB:CC:DD:EE:FF");
    REQUIRE_FALSE(f.manager.session().hasError);

    REQUIRE(f.config.saveAttempts().size() == 1);
    REQUIRE(f.config.stored().lastIdentity == "AA:BB:CC:DD:EE:FF");
    REQUIRE(f.config.stored().lastAddress == DEVICE_ADDRESS);

    REQUIRE(f.events.log == QStringList({"state:Connecting", "state:Connected", "catalog:0"}));
    REQUIRE(f.manager.statusText() == "Connected: 192.168.1.101 (AA:BB:CC:DD:EE:FF)");
    REQUIRE(f.events.statusTexts.contains("Connecting..."));
}

TEST_CASE("SessionManager initial listing keeps device order without markers", "[session][connect][catalog]") {
    SessionFixture f;
    f.transport->setReply("files", FakeDeviceTransport::reply(
        200, R"({"files":[{"name":"a.nc","size":120},{"name":"b.nc","size":340}]})"));

    REQUIRE(f.connectAndSettle());

    const QList<RemoteFile> expected = {RemoteFile("a.nc", 120), RemoteFile("b.nc", 340)};
    REQUIRE(f.manager.catalog().files() == expected);
    REQUIRE_FALSE(f.manager.catalog().hasActiveMarkers());
    REQUIRE(f.events.catalogFiles.last() == expected);
    REQUIRE(f.events.catalogChanged.last().isEmpty());
}

TEST_CASE("SessionManager rejects malformed addresses before any network call", "[session][connect]") {
    SessionFixture f;

    f.manager.connectToDevice("192.168.1.300");
    pumpEvents(50);

    REQUIRE(f.transport->requests().isEmpty());
    REQUIRE(f.manager.connectionState() == ConnectionState::Disconnected);
    REQUIRE(f.events.states.isEmpty());
    REQUIRE(f.events.errors.size() == 1);
    REQUIRE(f.events.errors.first().first == "connect");
    REQUIRE(f.events.errors.first().second.startsWith("InvalidAddress"));
    REQUIRE(f.manager.statusText() == "Invalid IP");
}

TEST_CASE("SessionManager handshake rejection goes through Failed to Disconnected", "[session][connect]") {
    SessionFixture f;

    SECTION("not our device") {
        f.transport->setIdentityBody("<html>router login</html>");
        f.manager.connectToDevice(DEVICE_ADDRESS);
        REQUIRE(waitUntil([&]() { return f.events.states.size() == 3; }));

        REQUIRE(f.events.errors.first().second.startsWith("ProtocolError"));
        REQUIRE(f.events.errors.first().second.contains("router login"));
        REQUIRE(f.manager.session().hasError);
        REQUIRE(f.manager.session().lastError.kind == DeviceErrorKind::Protocol);
    }

    SECTION("device unreachable") {
        f.transport->setReply(IDENTITY_KEY, TransportReply::failure("Connection refused"));
        f.manager.connectToDevice(DEVICE_ADDRESS);
        REQUIRE(waitUntil([&]() { return f.events.states.size() == 3; }));

        REQUIRE(f.events.errors.first().second.startsWith("TransportError"));
        REQUIRE(f.manager.session().lastError.kind == DeviceErrorKind::Transport);
    }

    REQUIRE(f.events.log == QStringList({"state:Connecting", "state:Failed", "error:connect", "state:Disconnected"}));
    REQUIRE(f.manager.connectionState() == ConnectionState::Disconnected);
    REQUIRE(f.manager.statusText() == "Connection Failed");
    REQUIRE(f.config.saveAttempts().isEmpty());
    REQUIRE(f.transport->requestCount("files") == 0);
}

TEST_CASE("SessionManager discards a handshake that resolves after disconnect", "[session][connect][cancel]") {
    SessionFixture f;
    f.transport->hold(IDENTITY_KEY);

    f.manager.connectToDevice(DEVICE_ADDRESS);
    REQUIRE(waitUntil([&]() { return f.transport->requestCount(IDENTITY_KEY) == 1; }));
    f.manager.disconnect();

    const QStringList logAtDisconnect = f.events.log;
    REQUIRE(logAtDisconnect == QStringList({"state:Connecting", "state:Disconnected"}));

    f.transport->release(IDENTITY_KEY);
    REQUIRE(waitUntil([&]() { return f.transport->completedCount(IDENTITY_KEY) == 1; }));
    pumpEvents(100);

    REQUIRE(f.events.log == logAtDisconnect);
    REQUIRE(f.manager.connectionState() == ConnectionState::Disconnected);
    REQUIRE(f.config.saveAttempts().isEmpty());
    REQUIRE(f.transport->requestCount("files") == 0);
}

TEST_CASE("SessionManager reconnect replaces a pending handshake", "[session][connect][cancel]") {
    SessionFixture f;
    f.transport->hold(IDENTITY_KEY);

    f.manager.connectToDevice(DEVICE_ADDRESS);
    const quint64 firstGeneration = f.manager.generation();
    f.manager.connectToDevice(OTHER_ADDRESS);
    REQUIRE(f.manager.generation() > firstGeneration);
    REQUIRE(waitUntil([&]() { return f.transport->requestCount(IDENTITY_KEY) == 2; }));

    f.transport->release(IDENTITY_KEY);
    REQUIRE(waitUntil([&]() { return f.manager.isConnected() && !f.manager.isRefreshInFlight(); }));
    pumpEvents(100);

    REQUIRE(f.manager.session().deviceAddress == OTHER_ADDRESS);
    REQUIRE(f.config.saveAttempts().size() == 1);
    REQUIRE(f.config.stored().lastAddress == OTHER_ADDRESS);
    REQUIRE(f.events.states == QList<ConnectionState>({ConnectionState::Connecting,
                                                       ConnectionState::Disconnected,
                                                       ConnectionState::Connecting,
                                                       ConnectionState::Connected}));
}

TEST_CASE("SessionManager disconnect clears the catalog", "[session][disconnect]") {
    SessionFixture f;
    f.transport->setFiles({RemoteFile("a.nc", 1)});
    REQUIRE(f.connectAndSettle());
    const quint64 before = f.manager.generation();

    f.manager.disconnect();

    REQUIRE(f.manager.generation() > before);
    REQUIRE(f.manager.connectionState() == ConnectionState::Disconnected);
    REQUIRE(f.manager.catalog().isEmpty());
    REQUIRE(f.events.catalogFiles.last().isEmpty());
    REQUIRE(f.manager.statusText() == "Disconnected");

    SECTION("a second disconnect is a no-op") {
        const QStringList log = f.events.log;
        f.manager.disconnect();
        REQUIRE(f.events.log == log);
    }
}

TEST_CASE("SessionManager stays connected when the config cannot be saved", "[session][config]") {
    SessionFixture f;
    f.config.setFailSaves(true);

    REQUIRE(f.connectAndSettle());

    REQUIRE(f.config.saveAttempts().size() == 1);
    REQUIRE(f.config.stored().isEmpty());
    REQUIRE(f.events.errors.isEmpty());
}

TEST_CASE("SessionManager shutdown ends the session and the keepalive", "[session][shutdown]") {
    SessionOptions options = testSessionOptions();
    options.keepaliveIntervalMs = 20;
    SessionFixture f(options);
    REQUIRE(f.connectAndSettle());

    f.manager.shutdown();
    pumpEvents(60);
    const int statusRequests = f.transport->requestCount(STATUS_KEY);
    pumpEvents(150);

    REQUIRE(f.manager.connectionState() == ConnectionState::Disconnected);
    REQUIRE(f.transport->requestCount(STATUS_KEY) == statusRequests);
}

// ═══════════════════════════════════════════════════════════════════════════
// Keepalive
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SessionManager keepalive reports heartbeats while connected", "[session][keepalive]") {
    SessionOptions options = testSessionOptions();
    options.keepaliveIntervalMs = 20;
    SessionFixture f(options);

    REQUIRE(f.connectAndSettle());
    REQUIRE(waitUntil([&]() { return f.events.heartbeats >= 3; }));
    REQUIRE(f.transport->requests().last().timeoutMs == options.controlTimeoutMs);

    f.manager.disconnect();
    pumpEvents(60);
    const int statusRequests = f.transport->requestCount(STATUS_KEY);
    const int heartbeats = f.events.heartbeats;
    pumpEvents(150);

    REQUIRE(f.transport->requestCount(STATUS_KEY) == statusRequests);
    REQUIRE(f.events.heartbeats == heartbeats);
}

TEST_CASE("SessionManager keepalive failures are soft", "[session][keepalive]") {
    SessionOptions options = testSessionOptions();
    options.keepaliveIntervalMs = 20;
    SessionFixture f(options);

    SECTION("error marker in the status body") {
        f.transport->setStatusBody("ERROR: SD busy");
    }

    SECTION("transport failure") {
        f.transport->setReply(STATUS_KEY, TransportReply::failure("Request timed out"));
    }

    REQUIRE(f.connectAndSettle());
    REQUIRE(waitUntil([&]() { return f.transport->completedCount(STATUS_KEY) >= 3; }));
    pumpEvents(30);

    REQUIRE(f.events.heartbeats == 0);
    REQUIRE(f.events.errors.isEmpty());
    REQUIRE(f.manager.connectionState() == ConnectionState::Connected);
}

TEST_CASE("SessionManager keepalive skips ticks while a status check is pending", "[session][keepalive]") {
    SessionOptions options = testSessionOptions();
    options.keepaliveIntervalMs = 20;
    SessionFixture f(options);
    f.transport->hold(STATUS_KEY);

    REQUIRE(f.connectAndSettle());
    pumpEvents(200);

    REQUIRE(f.transport->requestCount(STATUS_KEY) == 1);

    f.transport->release(STATUS_KEY);
    REQUIRE(waitUntil([&]() { return f.events.heartbeats >= 1; }));
}

TEST_CASE("SessionManager keepalive keeps beating while an upload is in flight", "[session][keepalive][upload]") {
    SessionOptions options = testSessionOptions();
    options.keepaliveIntervalMs = 20;
    SessionFixture f(options);
    REQUIRE(f.connectAndSettle());
    f.transport->hold("upload:big.nc");

    f.manager.runUpload({f.localFile("big.nc", 4096)});
    REQUIRE(waitUntil([&]() { return f.transport->requestCount("upload:big.nc") == 1; }));
    const int heartbeatsBefore = f.events.heartbeats;
    REQUIRE(waitUntil([&]() { return f.events.heartbeats >= heartbeatsBefore + 2; }));
    REQUIRE(f.manager.isBatchRunning(BatchKind::Upload));
    REQUIRE(f.events.batches.isEmpty());

    f.transport->release("upload:big.nc");
    REQUIRE(waitUntil([&]() { return f.events.batches.size() == 1 && !f.manager.isRefreshInFlight(); }));

    const auto& results = f.events.batches.first().second;
    REQUIRE(results.size() == 1);
    REQUIRE(results.first().outcome.success);
    REQUIRE(f.manager.connectionState() == ConnectionState::Connected);
    REQUIRE_FALSE(f.manager.isBatchRunning(BatchKind::Upload));
    REQUIRE(f.manager.catalog().hasMarker("big.nc"));
    REQUIRE(f.events.errors.isEmpty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Catalog refresh
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SessionManager refresh is a no-op while disconnected", "[session][refresh]") {
    SessionFixture f;
    f.manager.refreshCatalog();
    pumpEvents(50);
    REQUIRE(f.transport->requests().isEmpty());
    REQUIRE(f.events.log.isEmpty());
}

TEST_CASE("SessionManager coalesces overlapping refresh requests", "[session][refresh]") {
    SessionFixture f;
    REQUIRE(f.connectAndSettle());
    f.transport->hold("files");

    f.manager.refreshCatalog();
    f.manager.refreshCatalog();
    f.manager.refreshCatalog();
    pumpEvents(50);
    REQUIRE(f.transport->requestCount("files") == 2);

    f.transport->release("files");
    REQUIRE(f.settleRefresh());
    pumpEvents(50);
    REQUIRE(f.transport->requestCount("files") == 2);
}

TEST_CASE("SessionManager keeps the catalog when a refresh fails", "[session][refresh]") {
    SessionFixture f;
    f.transport->setFiles({RemoteFile("a.nc", 1), RemoteFile("b.nc", 2)});
    REQUIRE(f.connectAndSettle());
    const int catalogEvents = f.events.catalogFiles.size();

    f.transport->setReply("files", FakeDeviceTransport::reply(500, "internal error"));
    f.manager.refreshCatalog();
    REQUIRE(waitUntil([&]() { return !f.events.errors.isEmpty(); }));

    REQUIRE(f.events.errors.last().first == "refresh");
    REQUIRE(f.events.errors.last().second.contains("HTTP 500"));
    REQUIRE(f.manager.catalog().size() == 2);
    REQUIRE(f.events.catalogFiles.size() == catalogEvents);
    REQUIRE(f.manager.isConnected());
}

TEST_CASE("SessionManager refresh preserves markers only for files still listed", "[session][refresh][markers]") {
    SessionFixture f;
    REQUIRE(f.connectAndSettle());
    f.manager.runUpload({f.localFile("a.nc"), f.localFile("b.nc")});
    REQUIRE(waitUntil([&]() { return f.events.batches.size() == 1 && !f.manager.isRefreshInFlight(); }));
    REQUIRE(f.manager.catalog().hasMarker("a.nc"));
    REQUIRE(f.manager.catalog().hasMarker("b.nc"));

    // b.nc vanishes on the device side; c.nc appears
    f.transport->setFiles({RemoteFile("a.nc", 64), RemoteFile("c.nc", 5)});
    f.manager.refreshCatalog();
    REQUIRE(f.settleRefresh());

    REQUIRE(f.manager.catalog().fileNames() == QStringList({"a.nc", "c.nc"}));
    REQUIRE(f.manager.catalog().hasMarker("a.nc"));
    REQUIRE(f.manager.catalog().remainingTicks("a.nc") == 15);
    REQUIRE_FALSE(f.manager.catalog().hasMarker("b.nc"));
    REQUIRE_FALSE(f.manager.catalog().hasMarker("c.nc"));
    REQUIRE(f.events.catalogChanged.last().isEmpty());
}

TEST_CASE("SessionManager drops a refresh that completes after disconnect", "[session][refresh][cancel]") {
    SessionFixture f;
    f.transport->setFiles({RemoteFile("a.nc", 1), RemoteFile("b.nc", 2)});
    REQUIRE(f.connectAndSettle());

    f.transport->hold("files");
    f.transport->hold("delete:a.nc");
    f.manager.refreshCatalog();
    REQUIRE(waitUntil([&]() { return f.transport->requestCount("files") == 2; }));
    f.manager.runDelete({"a.nc"});
    REQUIRE(waitUntil([&]() { return f.transport->requestCount("delete:a.nc") == 1; }));

    f.manager.disconnect();
    const QStringList logAtDisconnect = f.events.log;

    f.transport->releaseAll();
    REQUIRE(waitUntil([&]() {
        return f.transport->completedCount("files") == 2 && f.transport->completedCount("delete:a.nc") == 1;
    }));
    pumpEvents(100);

    REQUIRE(f.events.log == logAtDisconnect);
    REQUIRE(f.events.batches.isEmpty());
    REQUIRE(f.manager.catalog().isEmpty());
    REQUIRE(f.events.catalogFiles.last().isEmpty());
    REQUIRE(f.manager.connectionState() == ConnectionState::Disconnected);
    REQUIRE(f.transport->requestCount("files") == 2);
}

TEST_CASE("SessionManager stops a batch between items after disconnect", "[session][upload][cancel]") {
    SessionFixture f;
    REQUIRE(f.connectAndSettle());
    f.transport->hold("upload:one.nc");

    f.manager.runUpload({f.localFile("one.nc"), f.localFile("two.nc"), f.localFile("three.nc")});
    REQUIRE(waitUntil([&]() { return f.transport->requestCount("upload:one.nc") == 1; }));
    f.manager.disconnect();
    const QStringList logAtDisconnect = f.events.log;

    f.transport->release("upload:one.nc");
    REQUIRE(waitUntil([&]() { return f.transport->completedCount("upload:one.nc") == 1; }));
    pumpEvents(100);

    REQUIRE(f.transport->requestCount("upload:two.nc") == 0);
    REQUIRE(f.transport->requestCount("upload:three.nc") == 0);
    REQUIRE(f.events.batches.isEmpty());
    REQUIRE(f.events.log == logAtDisconnect);
    REQUIRE_FALSE(f.manager.catalog().hasActiveMarkers());
    REQUIRE_FALSE(f.manager.isBatchRunning(BatchKind::Upload));
    REQUIRE(f.transport->requestCount("files") == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Batches
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SessionManager upload batch reports per-item outcomes", "[session][upload]") {
    SessionFixture f;
    REQUIRE(f.connectAndSettle());
    const QStringList paths = {f.localFile("f1.nc"), f.localFile("f2.nc"), f.localFile("f3.nc"), f.localFile("f4.nc")};
    f.transport->failUpload("f2.nc");

    f.manager.runUpload(paths);
    REQUIRE(f.events.statusTexts.contains("Uploading 4 file(s)..."));
    REQUIRE(waitUntil([&]() { return f.events.batches.size() == 1 && !f.manager.isRefreshInFlight(); }));

    const auto& batch = f.events.batches.first();
    REQUIRE(batch.first == BatchKind::Upload);
    REQUIRE(batch.second.size() == 4);
    REQUIRE(batch.second.at(0).outcome.success);
    REQUIRE_FALSE(batch.second.at(1).outcome.success);
    REQUIRE(batch.second.at(1).item == paths.at(1));
    REQUIRE(batch.second.at(1).remoteName == "f2.nc");
    REQUIRE(batch.second.at(2).outcome.success);
    REQUIRE(batch.second.at(3).outcome.success);

    REQUIRE(f.manager.catalog().fileNames() == QStringList({"f1.nc", "f3.nc", "f4.nc"}));
    REQUIRE(f.events.catalogChanged.last() == QStringList({"f1.nc", "f3.nc", "f4.nc"}));
    REQUIRE(f.manager.catalog().hasMarker("f1.nc"));
    REQUIRE_FALSE(f.manager.catalog().hasMarker("f2.nc"));
    REQUIRE(f.manager.catalog().remainingTicks("f4.nc") == 15);

    REQUIRE(f.events.errors.isEmpty());
    REQUIRE(f.manager.isConnected());
    REQUIRE(f.manager.statusText() == "Connected: 192.168.1.101 (AA:BB:CC:DD:EE:FF)");
}

TEST_CASE("SessionManager upload skips directories silently", "[session][upload]") {
    SessionFixture f;
    REQUIRE(f.connectAndSettle());
    REQUIRE(QDir(f.dir.path()).mkdir("nested"));

    f.manager.runUpload({QDir(f.dir.path()).filePath("nested"), f.localFile("part.nc")});
    REQUIRE(waitUntil([&]() { return f.events.batches.size() == 1; }));

    REQUIRE(f.events.batches.first().second.size() == 1);
    REQUIRE(f.events.batches.first().second.first().remoteName == "part.nc");
    REQUIRE(f.transport->requestCount("upload:nested") == 0);
}

TEST_CASE("SessionManager ignores batches that cannot run", "[session][upload][delete]") {
    SessionFixture f;

    SECTION("not connected") {
        f.manager.runUpload({f.localFile("a.nc")});
        f.manager.runDelete({"a.nc"});
    }

    SECTION("empty item lists") {
        REQUIRE(f.connectAndSettle());
        f.manager.runUpload({});
        f.manager.runDelete({});
    }

    pumpEvents(50);
    REQUIRE(f.events.batches.isEmpty());
    REQUIRE(f.events.errors.isEmpty());
    REQUIRE_FALSE(f.manager.isBatchRunning(BatchKind::Upload));
    REQUIRE_FALSE(f.manager.isBatchRunning(BatchKind::Delete));
}

TEST_CASE("SessionManager rejects a second batch of the same kind", "[session][upload]") {
    SessionFixture f;
    REQUIRE(f.connectAndSettle());
    f.transport->hold("upload:one.nc");

    f.manager.runUpload({f.localFile("one.nc")});
    REQUIRE(f.manager.isBatchRunning(BatchKind::Upload));
    f.manager.runUpload({f.localFile("two.nc")});

    REQUIRE(f.events.errors.size() == 1);
    REQUIRE(f.events.errors.first().first == "upload");

    f.transport->release("upload:one.nc");
    REQUIRE(waitUntil([&]() { return f.events.batches.size() == 1 && !f.manager.isRefreshInFlight(); }));
    pumpEvents(50);
    REQUIRE(f.events.batches.size() == 1);
    REQUIRE(f.transport->requestCount("upload:two.nc") == 0);
}

TEST_CASE("SessionManager runs upload and delete batches side by side", "[session][upload][delete]") {
    SessionFixture f;
    f.transport->setFiles({RemoteFile("old.nc", 10)});
    REQUIRE(f.connectAndSettle());
    f.transport->hold("upload:new.nc");

    f.manager.runUpload({f.localFile("new.nc")});
    f.manager.runDelete({"old.nc"});

    // the delete completes first even though it was issued second
    REQUIRE(waitUntil([&]() { return f.events.batches.size() == 1; }));
    REQUIRE(f.events.batches.first().first == BatchKind::Delete);
    REQUIRE(f.manager.isBatchRunning(BatchKind::Upload));

    f.transport->release("upload:new.nc");
    REQUIRE(waitUntil([&]() {
        return f.events.batches.size() == 2 && !f.manager.isRefreshInFlight()
            && f.manager.catalog().hasMarker("new.nc");
    }));

    REQUIRE(f.events.batches.last().first == BatchKind::Upload);
    REQUIRE(f.manager.catalog().fileNames() == QStringList({"new.nc"}));
}

TEST_CASE("SessionManager queues one follow-up refresh after a batch", "[session][refresh][upload]") {
    SessionFixture f;
    REQUIRE(f.connectAndSettle());
    f.transport->hold("files");

    f.manager.refreshCatalog();
    REQUIRE(waitUntil([&]() { return f.transport->requestCount("files") == 2; }));
    f.manager.runUpload({f.localFile("late.nc")});
    REQUIRE(waitUntil([&]() { return f.events.batches.size() == 1; }));
    REQUIRE(f.manager.isRefreshInFlight());

    f.transport->release("files");
    REQUIRE(waitUntil([&]() { return f.transport->completedCount("files") == 3 && !f.manager.isRefreshInFlight(); }));
    pumpEvents(50);

    REQUIRE(f.transport->requestCount("files") == 3);
    REQUIRE(f.manager.catalog().hasMarker("late.nc"));
    REQUIRE(f.events.catalogChanged.last() == QStringList({"late.nc"}));
}

TEST_CASE("SessionManager delete batch refreshes without marking", "[session][delete]") {
    SessionFixture f;
    f.transport->setFiles({RemoteFile("a.nc", 1), RemoteFile("b.nc", 2)});
    REQUIRE(f.connectAndSettle());

    f.manager.runDelete({"a.nc", "missing.nc"});
    REQUIRE(waitUntil([&]() { return f.events.batches.size() == 1 && !f.manager.isRefreshInFlight(); }));

    const auto& results = f.events.batches.first().second;
    REQUIRE(f.events.batches.first().first == BatchKind::Delete);
    REQUIRE(results.size() == 2);
    // existence is not verified by the device
    REQUIRE(results.at(0).outcome.success);
    REQUIRE(results.at(1).outcome.success);

    REQUIRE(f.manager.catalog().fileNames() == QStringList({"b.nc"}));
    REQUIRE_FALSE(f.manager.catalog().hasActiveMarkers());
    REQUIRE(f.transport->requests().last().queryValue("path") == "/");
}

TEST_CASE("SessionManager delete failure is collected per item", "[session][delete]") {
    SessionFixture f;
    f.transport->setFiles({RemoteFile("a.nc", 1), RemoteFile("b.nc", 2)});
    REQUIRE(f.connectAndSettle());
    f.transport->setReply("delete:a.nc", TransportReply::failure("Request timed out"));

    f.manager.runDelete({"a.nc", "b.nc"});
    REQUIRE(waitUntil([&]() { return f.events.batches.size() == 1 && !f.manager.isRefreshInFlight(); }));

    const auto& results = f.events.batches.first().second;
    REQUIRE_FALSE(results.at(0).outcome.success);
    REQUIRE(results.at(0).outcome.message.contains("Request timed out"));
    REQUIRE(results.at(1).outcome.success);
    REQUIRE(f.manager.catalog().fileNames() == QStringList({"a.nc"}));
    REQUIRE(f.manager.isConnected());
}

TEST_CASE("SessionManager does not refresh when a batch listener disconnects", "[session][cancel]") {
    SessionFixture f;
    f.transport->setFiles({RemoteFile("a.nc", 1)});
    REQUIRE(f.connectAndSettle());
    QObject::connect(&f.manager, &SessionManager::batchCompleted, &f.events.context,
                     [&f](BatchKind, const QList<BatchItemResult>&) { f.manager.disconnect(); });

    f.manager.runDelete({"a.nc"});
    REQUIRE(waitUntil([&]() { return f.events.batches.size() == 1; }));
    pumpEvents(50);

    REQUIRE(f.manager.connectionState() == ConnectionState::Disconnected);
    REQUIRE(f.transport->requestCount("files") == 1);
    REQUIRE(f.manager.statusText() == "Disconnected");
}

// ═══════════════════════════════════════════════════════════════════════════
// Change markers
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SessionManager change markers decay on their own timer", "[session][markers]") {
    SessionOptions options = testSessionOptions();
    options.markerTicks = 3;
    options.markerTickMs = 20;
    SessionFixture f(options);
    REQUIRE(f.connectAndSettle());

    f.manager.runUpload({f.localFile("fresh.nc")});
    REQUIRE(waitUntil([&]() { return f.events.batches.size() == 1 && !f.manager.isRefreshInFlight(); }));
    REQUIRE(f.manager.catalog().remainingTicks("fresh.nc") == 3);

    REQUIRE(waitUntil([&]() { return !f.manager.catalog().hasActiveMarkers(); }));
    pumpEvents(100);

    REQUIRE(f.events.markerTicks.size() == 3);
    REQUIRE(f.events.markerTicks.at(0).value("fresh.nc") == 2);
    REQUIRE(f.events.markerTicks.at(1).value("fresh.nc") == 1);
    REQUIRE(f.events.markerTicks.at(2).isEmpty());
    // the file itself stays listed
    REQUIRE(f.manager.catalog().contains("fresh.nc"));
}

TEST_CASE("SessionEventLogger follows the session it is attached to", "[session][logger]") {
    SessionOptions options = testSessionOptions();
    options.keepaliveIntervalMs = 20;
    SessionFixture f(options);
    SessionEventLogger logger;
    logger.attach(&f.manager);
    logger.attach(&f.manager);

    REQUIRE(f.connectAndSettle());
    REQUIRE(waitUntil([&]() { return f.events.heartbeats >= 2; }));
    f.manager.disconnect();
    pumpEvents(60);

    REQUIRE(logger.heartbeatCount() == f.events.heartbeats);
}
