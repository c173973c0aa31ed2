#pragma once

#include "credential_list.h"
#include "rtsp_transport.h"
#include "target_pattern.h"

#include <QString>

enum class OutcomeKind { CredentialValid, CredentialInvalid, NetworkError, ProtocolError };

QString outcomeKindName(OutcomeKind kind);

struct ProbeOutcome {
    OutcomeKind kind = OutcomeKind::ProtocolError;
    QString reason;                 // NetworkError / ProtocolError 일 때
    bool noAuthRequired = false;    // 첫 요청에 바로 200
    int requests = 0;               // 보낸 요청 수 (1 또는 2)
    QString scheme;                 // "Basic" / "Digest", 챌린지가 있었을 때

    bool isValid() const { return kind == OutcomeKind::CredentialValid; }
};

struct ProbeOptions {
    QString path;   // 비어 있으면 rtsp://host:port
};

// 대상 하나, 자격 증명 하나에 대해 DESCRIBE 두 번까지.
// 재시도는 하지 않는다. 401 이 Connection: close 였거나 연결이 이미 끊겼으면 두 번째 요청만 새 연결로.
// 두 번째 요청이 응답을 못 받으면 그대로 ProtocolError. 실패도 모두 ProbeOutcome 으로 돌려준다.
ProbeOutcome probeCredential(const Target& target, const Credential& credential,
                             RtspTransport& transport, const ProbeOptions& options = {});
