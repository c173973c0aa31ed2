#include "auth_probe.h"
#include "app_log.h"
#include "rtsp_auth.h"

static const QByteArray METHOD = "DESCRIBE";

QString outcomeKindName(OutcomeKind kind){
    switch(kind){
    case OutcomeKind::CredentialValid:   return "valid";
    case OutcomeKind::CredentialInvalid: return "invalid";
    case OutcomeKind::NetworkError:      return "network error";
    case OutcomeKind::ProtocolError:     return "protocol error";
    }
    return "unknown";
}

namespace {

struct TransportCloser {
    RtspTransport& transport;
    ~TransportCloser(){ transport.close(); }
};

ProbeOutcome makeOutcome(OutcomeKind kind, int requests, const QString& reason = QString()){
    ProbeOutcome o;
    o.kind = kind;
    o.requests = requests;
    o.reason = reason;
    return o;
}

ProbeOutcome fromTransport(const TransportReply& reply, int requests){
    switch(reply.status){
    case TransportStatus::ConnectFailed:
    case TransportStatus::Timeout:
    case TransportStatus::IoError:
        return makeOutcome(OutcomeKind::NetworkError, requests, reply.error);
    case TransportStatus::Closed:
    case TransportStatus::Malformed:
    case TransportStatus::Ok:
        break;
    }
    return makeOutcome(OutcomeKind::ProtocolError, requests, reply.error);
}

QString statusText(const RtspResponse& r){
    return QString("%1 %2").arg(r.status).arg(QString::fromLatin1(r.reason));
}

} // namespace

ProbeOutcome probeCredential(const Target& target, const Credential& credential,
                             RtspTransport& transport, const ProbeOptions& options)
{
    const QString uri = rtspUri(target.host(), target.port, options.path);
    const QByteArray userAgent = randomUserAgent();
    TransportCloser closer{ transport };
    QString err;

    // 1) 인증 없이 DESCRIBE
    if(transport.open(target, &err) != TransportStatus::Ok)
        return makeOutcome(OutcomeKind::NetworkError, 0, err);

    const TransportReply first = transport.exchange(buildDescribeRequest(uri, 1, userAgent));
    if(first.status != TransportStatus::Ok) return fromTransport(first, 1);

    if(first.response.status == 200){
        qCInfo(lcProbe) << uri << "accepted DESCRIBE without authentication";
        ProbeOutcome o = makeOutcome(OutcomeKind::CredentialValid, 1);
        o.noAuthRequired = true;
        return o;
    }
    if(first.response.status != 401)
        return makeOutcome(OutcomeKind::ProtocolError, 1, QString("unexpected status %1").arg(statusText(first.response)));

    // 2) 챌린지 → Authorization
    const auto challenge = selectChallenge(first.response, &err);
    if(!challenge) return makeOutcome(OutcomeKind::ProtocolError, 1, err);

    const auto authorization = buildAuthorization(*challenge, credential, METHOD, uri.toUtf8(), &err);
    if(!authorization) return makeOutcome(OutcomeKind::ProtocolError, 1, err);

    qCDebug(lcProbe) << uri << schemeName(*challenge) << "challenge, trying" << credential.username;

    // 401 뒤에 끊는 서버는 새 연결로. 요청 2 는 어느 쪽이든 한 번만 보낸다
    const bool peerCloses = first.response.header("Connection").trimmed().toLower() == "close";
    if(peerCloses || !transport.isOpen()){
        qCDebug(lcProbe) << uri << "closed after challenge, reconnecting";
        if(transport.open(target, &err) != TransportStatus::Ok)
            return makeOutcome(OutcomeKind::NetworkError, 1, err);
    }

    const TransportReply second = transport.exchange(buildDescribeRequest(uri, 2, userAgent, *authorization));
    ProbeOutcome o;
    if(second.status != TransportStatus::Ok){
        o = fromTransport(second, 2);
    } else if(second.response.status == 200){
        o = makeOutcome(OutcomeKind::CredentialValid, 2);
    } else if(second.response.status == 401){
        o = makeOutcome(OutcomeKind::CredentialInvalid, 2);
    } else {
        o = makeOutcome(OutcomeKind::ProtocolError, 2,
                        QString("unexpected status %1 after authorization").arg(statusText(second.response)));
    }
    o.scheme = schemeName(*challenge);
    return o;
}
