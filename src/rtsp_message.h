#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>

using RtspHeader = QPair<QByteArray, QByteArray>;

struct RtspResponse {
    int status = 0;
    QByteArray reason;
    QList<RtspHeader> headers;
    QByteArray body;

    // 이름은 대소문자 무시
    QByteArray header(const QByteArray& name) const;
    QList<QByteArray> headerValues(const QByteArray& name) const;
};

enum class ParseResult { Incomplete, Complete, Malformed };

// 응답 헤더 + Content-Length 본문의 상한
constexpr int kMaxResponseBytes = 64 * 1024;

// buffer 앞부분에 완전한 응답이 하나 있으면 Complete
ParseResult parseRtspResponse(const QByteArray& buffer, RtspResponse* out, QString* errOut = nullptr);

// "rtsp://host:port" + path
QString rtspUri(const QString& host, quint16 port, const QString& path);

QByteArray buildDescribeRequest(const QString& uri, int cseq, const QByteArray& userAgent,
                                const QByteArray& authorization = QByteArray());

QByteArray randomUserAgent();
