#include "list_reader.h"
#include "app_log.h"

#include <QFile>
#include <QHostAddress>
#include <QHostInfo>
#include <QRegularExpression>
#include <QTextStream>

bool readLines(const QString& path, QStringList* out, QString* errOut){
    QFile f(path);
    if(!f.open(QIODevice::ReadOnly | QIODevice::Text)){
        if(errOut) *errOut = QString("cannot read %1: %2").arg(path, f.errorString());
        return false;
    }
    QStringList lines;
    QTextStream in(&f);
#if QT_VERSION < QT_VERSION_CHECK(6, 0, 0)
    in.setCodec("UTF-8");
#endif
    while(!in.atEnd()){
        const QString line = in.readLine().trimmed();
        if(line.isEmpty() || line.startsWith('#')) continue;
        lines << line;
    }
    qCDebug(lcApp) << path << "->" << lines.size() << "entries";
    *out = lines;
    return true;
}

bool loadList(const QString& file, const QString& inlineValue, QStringList* out, QString* errOut){
    if(!inlineValue.isEmpty()){
        *out = QStringList{ inlineValue };
        return true;
    }
    if(file.isEmpty()){
        if(errOut) *errOut = "no list source given";
        return false;
    }
    return readLines(file, out, errOut);
}

// "camera.local" / "camera.local:{554,8554}" → 첫 IPv4 주소
static bool resolveHostLine(const QString& line, TargetPattern* out, QString* errOut){
    static const QRegularExpression hostRe("^([A-Za-z0-9](?:[A-Za-z0-9.-]*[A-Za-z0-9])?)(?::(.+))?$");
    const auto m = hostRe.match(line);
    if(!m.hasMatch() || !m.captured(1).contains(QRegularExpression("[A-Za-z]"))){
        if(errOut) *errOut = "not a host name";
        return false;
    }

    std::vector<quint16> ports{ TargetPattern::kDefaultPort };
    if(!m.captured(2).isEmpty()){
        PatternError perr;
        if(!TargetPattern::parsePorts(m.captured(2), &ports, &perr)){
            if(errOut) *errOut = perr.toString();
            return false;
        }
    }

    const QString host = m.captured(1);
    const QHostInfo info = QHostInfo::fromName(host);
    if(info.error() != QHostInfo::NoError){
        if(errOut) *errOut = QString("cannot resolve %1: %2").arg(host, info.errorString());
        return false;
    }
    for(const QHostAddress& a : info.addresses()){
        if(a.protocol() != QAbstractSocket::IPv4Protocol) continue;
        qCDebug(lcPattern) << host << "resolved to" << a.toString();
        *out = TargetPattern::fromAddress(a.toIPv4Address(), ports);
        return true;
    }
    if(errOut) *errOut = QString("%1 has no IPv4 address").arg(host);
    return false;
}

bool buildTargetSequence(const QStringList& lines, TargetSequence* out, QString* errOut){
    TargetSequence seq;
    for(const QString& raw : lines){
        const QString line = raw.trimmed();
        if(line.isEmpty()) continue;

        PatternError perr;
        if(auto p = TargetPattern::parse(line, &perr)){
            seq.append(std::move(*p));
            continue;
        }
        TargetPattern resolved = TargetPattern::fromAddress(0);
        QString herr;
        if(resolveHostLine(line, &resolved, &herr)){
            seq.append(std::move(resolved));
            continue;
        }
        qCWarning(lcPattern).noquote() << "skipping" << line << "-" << perr.toString() << "/" << herr;
    }
    if(seq.isEmpty()){
        if(errOut) *errOut = "no usable target patterns";
        return false;
    }
    qCInfo(lcPattern) << seq.patternCount() << "patterns," << seq.size() << "targets";
    *out = std::move(seq);
    return true;
}
