#include "rtsp_message.h"

#include <QRandomGenerator>

static const char* USER_AGENTS[] = {
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36",
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:89.0) Gecko/20100101 Firefox/89.0",
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/14.1.1 Safari/605.1.15",
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/91.0.4472.124 Safari/537.36 Edg/91.0.864.59",
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/91.0.4472.114 Safari/537.36",
};

QByteArray RtspResponse::header(const QByteArray& name) const {
    for(const auto& h : headers)
        if(h.first.compare(name, Qt::CaseInsensitive) == 0) return h.second;
    return {};
}

QList<QByteArray> RtspResponse::headerValues(const QByteArray& name) const {
    QList<QByteArray> out;
    for(const auto& h : headers)
        if(h.first.compare(name, Qt::CaseInsensitive) == 0) out << h.second;
    return out;
}

ParseResult parseRtspResponse(const QByteArray& buffer, RtspResponse* out, QString* errOut){
    auto malformed = [&](const QString& why){
        if(errOut) *errOut = why;
        return ParseResult::Malformed;
    };

    // CRLF 가 표준이지만 LF 만 쓰는 장비도 있다
    int headerEnd = buffer.indexOf("\r\n\r\n");
    int sepLen = 4;
    const int lfEnd = buffer.indexOf("\n\n");
    if(lfEnd >= 0 && (headerEnd < 0 || lfEnd < headerEnd)){ headerEnd = lfEnd; sepLen = 2; }
    if(headerEnd < 0){
        if(buffer.size() > kMaxResponseBytes) return malformed("response header too large");
        return ParseResult::Incomplete;
    }

    QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
    for(auto& l : lines) if(l.endsWith('\r')) l.chop(1);

    const QByteArray statusLine = lines.takeFirst();
    if(!statusLine.startsWith("RTSP/")) return malformed(QString("bad status line: %1").arg(QString::fromLatin1(statusLine.left(80))));
    const int sp1 = statusLine.indexOf(' ');
    if(sp1 < 0) return malformed("status line without status code");
    int sp2 = statusLine.indexOf(' ', sp1 + 1);
    if(sp2 < 0) sp2 = statusLine.size();
    bool ok = false;
    const int status = statusLine.mid(sp1 + 1, sp2 - sp1 - 1).toInt(&ok);
    if(!ok || status < 100 || status > 599) return malformed(QString("bad status code in: %1").arg(QString::fromLatin1(statusLine)));

    RtspResponse resp;
    resp.status = status;
    resp.reason = statusLine.mid(sp2 + 1).trimmed();

    for(const QByteArray& line : lines){
        if(line.isEmpty()) continue;
        if((line[0] == ' ' || line[0] == '\t') && !resp.headers.isEmpty()){
            resp.headers.last().second += ' ' + line.trimmed();
            continue;
        }
        const int colon = line.indexOf(':');
        if(colon <= 0) return malformed(QString("bad header line: %1").arg(QString::fromLatin1(line.left(80))));
        resp.headers.append(qMakePair(line.left(colon).trimmed(), line.mid(colon + 1).trimmed()));
    }

    const int bodyStart = headerEnd + sepLen;
    const QByteArray lenText = resp.header("Content-Length");
    if(!lenText.isEmpty()){
        const int len = lenText.toInt(&ok);
        if(!ok || len < 0) return malformed(QString("bad Content-Length: %1").arg(QString::fromLatin1(lenText)));
        if(len > kMaxResponseBytes) return malformed("response body too large");
        if(buffer.size() - bodyStart < len) return ParseResult::Incomplete;
        resp.body = buffer.mid(bodyStart, len);
    }

    *out = std::move(resp);
    return ParseResult::Complete;
}

QString rtspUri(const QString& host, quint16 port, const QString& path){
    QString p = path;
    if(!p.isEmpty() && !p.startsWith('/')) p.prepend('/');
    return QString("rtsp://%1:%2%3").arg(host).arg(port).arg(p);
}

QByteArray buildDescribeRequest(const QString& uri, int cseq, const QByteArray& userAgent,
                                const QByteArray& authorization)
{
    QByteArray req;
    req += "DESCRIBE " + uri.toUtf8() + " RTSP/1.0\r\n";
    req += "CSeq: " + QByteArray::number(cseq) + "\r\n";
    req += "User-Agent: " + userAgent + "\r\n";
    req += "Accept: application/sdp\r\n";
    if(!authorization.isEmpty())
        req += "Authorization: " + authorization + "\r\n";
    req += "\r\n";
    return req;
}

QByteArray randomUserAgent(){
    const int n = int(sizeof(USER_AGENTS) / sizeof(USER_AGENTS[0]));
    return USER_AGENTS[QRandomGenerator::global()->bounded(n)];
}
