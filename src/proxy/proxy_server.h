#pragma once
#include "config/config_types.h"
#include "semantic/failure.h"
#include <QHash>
#include <QHostAddress>
#include <QMap>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>

class CancellationToken;
class QTimer;
class IBackendClient;
class PipelineStreamSession;
class UsageRecorder;

// Plain HTTP/1.1 front for the Claude Messages endpoint.
class ProxyServer : public QObject {
    Q_OBJECT
public:
    ProxyServer(const BridgeConfig& config,
                IBackendClient* client,
                UsageRecorder* usage = nullptr,
                QObject* parent = nullptr);
    ~ProxyServer() override;

    bool start();
    bool listen(const QHostAddress& address, quint16 port);
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;
    int activeStreamCount() const;

signals:
    void statusChanged(bool running);

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();
    void processBuffer(QTcpSocket* socket);

private:
    struct HttpRequest {
        QString method, path, httpVersion;
        QMap<QString, QString> headers;
        QByteArray body;
    };

    struct Connection {
        QByteArray buffer;
        CancellationToken* token = nullptr;
        PipelineStreamSession* session = nullptr;
        bool busy = false;
        bool closed = false;
    };

    static HttpRequest parseHttpRequest(const QByteArray& data);
    void handleRequest(QTcpSocket* socket, const HttpRequest& request);
    void handleMessages(QTcpSocket* socket, const HttpRequest& request);
    void handleHealth(QTcpSocket* socket);
    void sendHttpResponse(QTcpSocket* socket, int status, const QByteArray& body,
                          const QString& contentType = QStringLiteral("application/json"));
    void sendFailure(QTcpSocket* socket, const ErrorEnvelope& failure);
    void sendStreamResponse(QTcpSocket* socket, PipelineStreamSession* session,
                            CancellationToken* token, QTimer* timer);
    bool releaseIfClosed(QTcpSocket* socket);
    void rejectAndClose(QTcpSocket* socket, const ErrorEnvelope& failure);

    static constexpr int kMaxHeaderBytes = 64 * 1024;

    BridgeConfig m_config;
    IBackendClient* m_client;
    UsageRecorder* m_usage;
    QTcpServer* m_server = nullptr;
    QHash<QTcpSocket*, Connection> m_connections;
};
