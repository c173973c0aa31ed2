#pragma once

#include "credential_list.h"
#include "rtsp_message.h"

#include <QByteArray>
#include <QCryptographicHash>
#include <QMap>

#include <optional>
#include <variant>

// ========================= 인증 챌린지 =========================
struct BasicChallenge {
    QByteArray realm;
};

struct DigestChallenge {
    QByteArray realm;
    QByteArray nonce;
    QByteArray opaque;
    QByteArray qop;         // 고른 값 ("auth" / "auth-int"), 없으면 RFC 2069 방식
    QByteArray algorithm;   // 서버가 보낸 그대로, 비어 있으면 MD5
    bool stale = false;
};

// 스킴은 프로토콜이 정한 두 가지뿐
using AuthChallenge = std::variant<BasicChallenge, DigestChallenge>;

QString schemeName(const AuthChallenge& challenge);

// realm="a", nonce=b ... → 소문자 key → 값 (따옴표 제거)
QMap<QByteArray, QByteArray> parseAuthParams(const QByteArray& text);

// WWW-Authenticate 값 하나. 모르는 스킴이면 nullopt + errOut
std::optional<AuthChallenge> parseChallengeHeader(const QByteArray& value, QString* errOut = nullptr);

// 응답의 WWW-Authenticate 헤더들 중 하나를 고른다 (Digest 우선)
std::optional<AuthChallenge> selectChallenge(const RtspResponse& response, QString* errOut = nullptr);

// ========================= Digest 계산 =========================
struct DigestAlgorithm {
    QCryptographicHash::Algorithm hash = QCryptographicHash::Md5;
    bool session = false;   // "-sess"
};

std::optional<DigestAlgorithm> digestAlgorithm(const QByteArray& name);

struct DigestInput {
    QByteArray username;
    QByteArray password;
    QByteArray realm;
    QByteArray nonce;
    QByteArray method;
    QByteArray uri;
    QByteArray qop;                     // 비어 있으면 nc/cnonce 를 쓰지 않는다
    QByteArray cnonce;
    QByteArray nonceCount = "00000001";
    QByteArray entityBody;              // qop=auth-int 일 때만
};

// HA1 / HA2 / response, 결과는 소문자 hex
QByteArray digestResponse(const DigestAlgorithm& algorithm, const DigestInput& in);

QByteArray generateCnonce();

// ========================= Authorization 헤더 =========================
QByteArray basicAuthorization(const Credential& credential);

std::optional<QByteArray> digestAuthorization(const DigestChallenge& challenge, const Credential& credential,
                                              const QByteArray& method, const QByteArray& uri,
                                              const QByteArray& cnonce = QByteArray(),
                                              QString* errOut = nullptr);

std::optional<QByteArray> buildAuthorization(const AuthChallenge& challenge, const Credential& credential,
                                             const QByteArray& method, const QByteArray& uri,
                                             QString* errOut = nullptr);
