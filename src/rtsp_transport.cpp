#include "rtsp_transport.h"
#include "app_log.h"

#include <QDeadlineTimer>
#include <QHostAddress>
#include <QTcpSocket>

QString transportStatusName(TransportStatus status){
    switch(status){
    case TransportStatus::Ok:            return "ok";
    case TransportStatus::ConnectFailed: return "connect failed";
    case TransportStatus::Timeout:       return "timeout";
    case TransportStatus::Closed:        return "closed";
    case TransportStatus::IoError:       return "io error";
    case TransportStatus::Malformed:     return "malformed";
    }
    return "unknown";
}

TcpRtspTransport::TcpRtspTransport(TransportTimeouts timeouts)
    : timeouts_(timeouts) {}

TcpRtspTransport::~TcpRtspTransport(){ close(); }

TransportStatus TcpRtspTransport::open(const Target& target, QString* errOut){
    close();
    socket_ = std::make_unique<QTcpSocket>();
    socket_->connectToHost(QHostAddress(target.address), target.port);
    if(!socket_->waitForConnected(timeouts_.connectMs)){
        const bool timedOut = socket_->error() == QAbstractSocket::SocketTimeoutError;
        if(errOut) *errOut = QString("connect %1: %2")
                                 .arg(target.toString(), timedOut ? QString("timeout") : socket_->errorString());
        socket_->abort();
        socket_.reset();
        return timedOut ? TransportStatus::Timeout : TransportStatus::ConnectFailed;
    }
    target_ = target;
    qCDebug(lcProbe) << "connected to" << target.toString();
    return TransportStatus::Ok;
}

bool TcpRtspTransport::isOpen() const {
    if(!socket_) return false;
    // 이미 도착한 FIN 은 한 번 읽어 봐야 상태에 반영된다
    if(socket_->state() == QAbstractSocket::ConnectedState && socket_->bytesAvailable() == 0)
        socket_->waitForReadyRead(0);
    return socket_->state() == QAbstractSocket::ConnectedState;
}

TransportReply TcpRtspTransport::exchange(const QByteArray& request){
    TransportReply reply;
    auto fail = [&](TransportStatus st, const QString& why){
        reply.status = st;
        reply.error = QString("%1: %2").arg(target_.toString(), why);
        return reply;
    };
    auto socketFailure = [&](const QString& what){
        switch(socket_->error()){
        case QAbstractSocket::SocketTimeoutError:    return fail(TransportStatus::Timeout, what + " timeout");
        case QAbstractSocket::RemoteHostClosedError: return fail(TransportStatus::Closed, "connection closed by peer");
        default:                                     return fail(TransportStatus::IoError, socket_->errorString());
        }
    };

    if(!isOpen()) return fail(TransportStatus::Closed, "not connected");

    qCDebug(lcWire).noquote() << ">>" << target_.toString() << "\n" << QString::fromUtf8(request);

    QDeadlineTimer deadline(timeouts_.ioMs);
    if(socket_->write(request) != request.size()) return fail(TransportStatus::IoError, socket_->errorString());
    while(socket_->bytesToWrite() > 0){
        if(!socket_->waitForBytesWritten(int(deadline.remainingTime()))) return socketFailure("write");
    }

    QByteArray buffer;
    for(;;){
        buffer += socket_->readAll();
        if(!buffer.isEmpty()){
            QString err;
            const ParseResult pr = parseRtspResponse(buffer, &reply.response, &err);
            if(pr == ParseResult::Complete){
                qCDebug(lcWire).noquote() << "<<" << target_.toString() << "\n" << QString::fromUtf8(buffer);
                return reply;
            }
            if(pr == ParseResult::Malformed) return fail(TransportStatus::Malformed, err);
        }
        if(deadline.hasExpired()) return fail(TransportStatus::Timeout, "read timeout");
        if(!socket_->waitForReadyRead(int(deadline.remainingTime()))){
            buffer += socket_->readAll();
            if(socket_->error() == QAbstractSocket::RemoteHostClosedError
               || socket_->state() != QAbstractSocket::ConnectedState)
            {
                if(buffer.isEmpty()) return fail(TransportStatus::Closed, "empty response");
                QString err;
                if(parseRtspResponse(buffer, &reply.response, &err) == ParseResult::Complete) return reply;
                return fail(TransportStatus::Malformed, err.isEmpty() ? QString("truncated response") : err);
            }
            return socketFailure("read");
        }
    }
}

void TcpRtspTransport::close(){
    if(!socket_) return;
    socket_->abort();
    socket_.reset();
}

TransportFactory tcpTransportFactory(TransportTimeouts timeouts){
    return [timeouts]{ return std::unique_ptr<RtspTransport>(new TcpRtspTransport(timeouts)); };
}
