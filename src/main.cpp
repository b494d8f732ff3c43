#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>

#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QTimer>

#include "device_json.h"
#include "gateway_client.h"
#include "sync_config.h"
#include "sync_session.h"
#include "websocket_transport.h"

namespace {

std::atomic_bool g_running{true};

void handleSignal(int)
{
    g_running.store(false);
}

void printUsage(const char *argv0)
{
    std::cerr << "usage: " << argv0 << " [config.json] [--set <device> <property>=<value>]\n"
              << "config path falls back to $HOMESYNC_CONFIG\n";
}

// "true", "42" and "\"x\"" parse as JSON, anything else is a plain string.
QJsonValue parseValue(const QString &text)
{
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArrayLiteral("[") + text.toUtf8() + QByteArrayLiteral("]"));
    if (doc.isArray() && doc.array().size() == 1)
        return doc.array().at(0);
    return QJsonValue(text);
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    QString configPath;
    QString setDevice;
    QString setProperty;
    QJsonValue setValue;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "--set") == 0) {
            if (i + 2 >= argc) {
                printUsage(argv[0]);
                return 2;
            }
            setDevice = QString::fromLocal8Bit(argv[++i]);
            const QString assignment = QString::fromLocal8Bit(argv[++i]);
            const int eq = assignment.indexOf(QLatin1Char('='));
            if (eq <= 0) {
                std::cerr << "expected <property>=<value>, got " << argv[i] << '\n';
                return 2;
            }
            setProperty = assignment.left(eq);
            setValue = parseValue(assignment.mid(eq + 1));
            continue;
        }
        configPath = QString::fromLocal8Bit(argv[i]);
    }

    if (configPath.isEmpty()) {
        const char *envConfig = std::getenv("HOMESYNC_CONFIG");
        if (envConfig)
            configPath = QString::fromLocal8Bit(envConfig);
    }
    if (configPath.isEmpty()) {
        printUsage(argv[0]);
        return 2;
    }

    homesync::SessionConfig config;
    QString error;
    if (!homesync::readSessionConfigFile(configPath, &config, &error)) {
        std::cerr << "failed to load config: " << error.toStdString() << '\n';
        return 1;
    }
    if (config.gateway.host.isEmpty()) {
        std::cerr << "config has no gateway.host\n";
        return 1;
    }
    if (!config.logRules.isEmpty())
        QLoggingCategory::setFilterRules(config.logRules);

    std::cerr << "starting homesync-monitor gateway=" << config.gateway.baseUrl().toString().toStdString()
              << " push=" << config.gateway.pushUrl().toString().toStdString() << '\n';

    homesync::WebSocketTransport transport;
    transport.setBearerToken(config.gateway.token);
    homesync::GatewayClient gateway(config.gateway, config.poll.requestTimeoutMs, config.write.requestTimeoutMs);
    homesync::SyncSession session(config, &transport, &gateway, &gateway);

    const QMetaObject::Connection printer = QObject::connect(session.store(), &homesync::DeviceStore::devicesChanged,
                     [&session](const QStringList &ids) {
        for (const QString &id : ids) {
            const std::optional<homesync::DeviceEntity> device = session.store()->device(id);
            if (!device) {
                std::cout << id.toStdString() << " removed" << std::endl;
                continue;
            }
            const QByteArray json = QJsonDocument(homesync::deviceToJson(*device)).toJson(QJsonDocument::Compact);
            std::cout << json.constData() << std::endl;
        }
    });
    QObject::connect(&session, &homesync::SyncSession::connectionStateChanged,
                     [](homesync::ConnectionState state) {
        std::cerr << "push channel " << homesync::connectionStateName(state).toStdString() << '\n';
    });
    QObject::connect(&session, &homesync::SyncSession::syncError,
                     [](const homesync::SyncError &err) {
        std::cerr << homesync::syncErrorKindName(err.kind).toStdString() << ": " << err.message.toStdString();
        if (!err.deviceId.isEmpty())
            std::cerr << " (" << err.deviceId.toStdString() << ')';
        std::cerr << '\n';
    });

    if (!setDevice.isEmpty()) {
        // Send once the first snapshot is in so the optimistic merge has a target.
        auto sent = std::make_shared<bool>(false);
        QObject::connect(session.store(), &homesync::DeviceStore::snapshotApplied,
                         [&session, sent, setDevice, setProperty, setValue](int) {
            if (*sent)
                return;
            *sent = true;
            if (!session.store()->contains(setDevice))
                std::cerr << "device " << setDevice.toStdString() << " not in snapshot, sending anyway\n";
            session.requestPropertyChange(setDevice, setProperty, setValue);
            session.writer()->flush();
        });
    }

    QTimer signalCheck;
    QObject::connect(&signalCheck, &QTimer::timeout, &app, [&app]() {
        if (!g_running.load())
            app.quit();
    });
    signalCheck.start(250);

    session.start();
    const int rc = app.exec();

    // Teardown empties the store; that is not a removal worth printing.
    QObject::disconnect(printer);
    session.shutdown();
    std::cerr << "stopping homesync-monitor" << '\n';
    return rc;
}
