#pragma once

#include "rtsp_message.h"
#include "target_pattern.h"

#include <QString>

#include <functional>
#include <memory>

class QTcpSocket;

enum class TransportStatus {
    Ok,
    ConnectFailed,  // 거부, 라우팅 불가 등
    Timeout,        // 연결/쓰기/읽기 시간 초과
    Closed,         // 응답 없이 연결이 닫힘
    IoError,        // reset 등 소켓 오류
    Malformed,      // 받았지만 RTSP 응답이 아님
};

QString transportStatusName(TransportStatus status);

struct TransportReply {
    TransportStatus status = TransportStatus::Ok;
    RtspResponse response;
    QString error;
};

// 프로브 하나가 독점하는 연결. 모든 호출은 만든 스레드에서만 한다.
class RtspTransport {
public:
    virtual ~RtspTransport() = default;

    virtual TransportStatus open(const Target& target, QString* errOut = nullptr) = 0;
    virtual bool isOpen() const = 0;
    // 요청 하나 보내고 응답 하나 받기
    virtual TransportReply exchange(const QByteArray& request) = 0;
    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<RtspTransport>()>;

struct TransportTimeouts {
    int connectMs = 5000;
    int ioMs = 10000;
};

// QTcpSocket 의 blocking API (waitFor*) 를 쓰는 구현
class TcpRtspTransport : public RtspTransport {
public:
    explicit TcpRtspTransport(TransportTimeouts timeouts = {});
    ~TcpRtspTransport() override;

    TransportStatus open(const Target& target, QString* errOut = nullptr) override;
    bool isOpen() const override;
    TransportReply exchange(const QByteArray& request) override;
    void close() override;

private:
    TransportTimeouts timeouts_;
    std::unique_ptr<QTcpSocket> socket_;
    Target target_;
};

TransportFactory tcpTransportFactory(TransportTimeouts timeouts);
