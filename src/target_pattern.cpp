#include "target_pattern.h"
#include "app_log.h"

#include <QStringList>

#include <algorithm>

QString Target::host() const {
    return QString("%1.%2.%3.%4")
        .arg((address >> 24) & 0xff)
        .arg((address >> 16) & 0xff)
        .arg((address >> 8) & 0xff)
        .arg(address & 0xff);
}

QString Target::toString() const {
    return QString("%1:%2").arg(host()).arg(port);
}

// ========================= 값 목록 파서 =========================
namespace {

struct ValueParser {
    const QString& s;
    quint32 maxValue;
    int pos = 0;
    QString error;

    bool atEnd() const { return pos >= s.size(); }
    bool peek(QChar c) const { return !atEnd() && s[pos] == c; }

    QString here() const {
        return atEnd() ? QString("end of input") : QString("'%1' at %2").arg(s[pos]).arg(pos);
    }

    bool number(quint32* out){
        const int start = pos;
        quint64 v = 0;
        while(!atEnd() && s[pos] >= '0' && s[pos] <= '9'){
            // 상한을 넘으면 maxValue + 1 에 머문다. 앞자리 0 은 값에 영향 없음
            v = qMin<quint64>(v * 10 + quint64(s[pos].unicode() - '0'), quint64(maxValue) + 1);
            ++pos;
        }
        if(pos == start){ error = QString("number expected, got %1").arg(here()); return false; }
        if(v > maxValue){
            error = QString("%1 is out of range 0-%2").arg(s.mid(start, pos - start)).arg(maxValue);
            return false;
        }
        *out = quint32(v);
        return true;
    }

    bool item(std::vector<quint32>& out){
        if(peek('{')){
            ++pos;
            if(!list(out)) return false;
            if(!peek('}')){ error = QString("missing '}', got %1").arg(here()); return false; }
            ++pos;
            return true;
        }
        quint32 lo = 0;
        if(!number(&lo)) return false;
        if(!peek('-')){ out.push_back(lo); return true; }
        ++pos;
        quint32 hi = 0;
        if(!number(&hi)) return false;
        if(lo > hi){ error = QString("inverted range %1-%2").arg(lo).arg(hi); return false; }
        for(quint32 v = lo; v <= hi; ++v) out.push_back(v);
        return true;
    }

    bool list(std::vector<quint32>& out){
        for(;;){
            if(!item(out)) return false;
            if(!peek(',')) return true;
            ++pos;
        }
    }
};

} // namespace

static bool parseValues(const QString& text, quint32 maxValue, std::vector<quint32>* out, QString* why){
    if(text.isEmpty()){ *why = "empty"; return false; }
    ValueParser p{text, maxValue};
    std::vector<quint32> values;
    if(!p.list(values)){ *why = p.error; return false; }
    if(!p.atEnd()){
        *why = p.peek('}') ? QString("unbalanced '}' at %1").arg(p.pos)
                           : QString("unexpected %1").arg(p.here());
        return false;
    }
    *out = std::move(values);
    return true;
}

// ========================= TargetPattern =========================
bool TargetPattern::parsePorts(const QString& text, std::vector<quint16>* out, PatternError* err){
    std::vector<quint32> values; QString why;
    if(!parseValues(text.trimmed(), 65535, &values, &why)){
        if(err) *err = { QString("port '%1'").arg(text), why };
        return false;
    }
    out->assign(values.begin(), values.end());
    return true;
}

std::optional<TargetPattern> TargetPattern::parse(const QString& input, PatternError* err){
    auto fail = [&](const QString& segment, const QString& message) -> std::optional<TargetPattern> {
        if(err) *err = { segment, message };
        qCDebug(lcPattern) << "rejected" << input << "-" << segment << message;
        return std::nullopt;
    };

    const QString text = input.trimmed();
    if(text.isEmpty()) return fail("pattern", "empty pattern");

    QString addrPart = text;
    QString portPart;
    bool hasPort = false;
    const int colon = text.indexOf(':');
    if(colon >= 0){
        addrPart = text.left(colon);
        portPart = text.mid(colon + 1);
        hasPort = true;
    }

    QString maskPart;
    bool hasMask = false;
    const int slash = addrPart.indexOf('/');
    if(slash >= 0){
        maskPart = addrPart.mid(slash + 1);
        addrPart = addrPart.left(slash);
        hasMask = true;
    }

    const QStringList octets = addrPart.split('.');
    if(octets.size() != 4)
        return fail(QString("address '%1'").arg(addrPart), QString("expected 4 octets, got %1").arg(octets.size()));

    TargetPattern pattern;
    pattern.text_ = text;

    for(int i = 0; i < 4; ++i){
        std::vector<quint32> values; QString why;
        if(!parseValues(octets[i].trimmed(), 255, &values, &why))
            return fail(QString("octet %1 '%2'").arg(i + 1).arg(octets[i]), why);
        pattern.octets_[size_t(i)].assign(values.begin(), values.end());
    }

    if(hasMask){
        bool ok = false;
        const int bits = maskPart.toInt(&ok);
        const bool digitsOnly = !maskPart.isEmpty()
            && std::all_of(maskPart.begin(), maskPart.end(), [](QChar c){ return c >= '0' && c <= '9'; });
        if(!ok || !digitsOnly || bits < 0 || bits > 32)
            return fail(QString("mask '/%1'").arg(maskPart), "mask bits must be 0-32");
        pattern.maskBits_ = bits;
        pattern.hostCount_ = quint64(1) << (32 - bits);

        // 옥텟별로 네트워크 부분만 남기고 중복 제거 (출현 순서 유지)
        for(int i = 0; i < 4; ++i){
            const int bitsHere = qBound(0, bits - 8 * i, 8);
            const quint8 m = quint8(0xff << (8 - bitsHere));
            std::array<bool, 256> seen{};
            std::vector<quint8> masked;
            for(quint8 v : pattern.octets_[size_t(i)]){
                const quint8 mv = bitsHere ? quint8(v & m) : quint8(0);
                if(seen[mv]) continue;
                seen[mv] = true;
                masked.push_back(mv);
            }
            pattern.octets_[size_t(i)] = std::move(masked);
        }
    }

    if(hasPort){
        PatternError portErr;
        if(!parsePorts(portPart, &pattern.ports_, &portErr)) return fail(portErr.segment, portErr.message);
    } else {
        pattern.ports_ = { kDefaultPort };
    }

    qCDebug(lcPattern) << "pattern" << text << "->" << pattern.size() << "targets";
    return pattern;
}

TargetPattern TargetPattern::fromAddress(quint32 address, std::vector<quint16> ports){
    TargetPattern pattern;
    for(int i = 0; i < 4; ++i)
        pattern.octets_[size_t(i)] = { quint8((address >> (24 - 8 * i)) & 0xff) };
    pattern.ports_ = ports.empty() ? std::vector<quint16>{ kDefaultPort } : std::move(ports);
    pattern.text_ = Target{ address, pattern.ports_.front() }.host();
    return pattern;
}

quint64 TargetPattern::size() const {
    quint64 n = hostCount_ * quint64(ports_.size());
    for(const auto& o : octets_) n *= quint64(o.size());
    return n;
}

bool TargetPattern::Cursor::next(Target* out){
    const TargetPattern& p = *pattern_;
    if(pos_ >= p.size()) return false;

    // 혼합 기수: [octet1][octet2][octet3][octet4][host][port], port 가 가장 빨리 변한다
    quint64 rest = pos_++;
    const quint64 nPorts = p.ports_.size();
    const quint16 port = p.ports_[size_t(rest % nPorts)];
    rest /= nPorts;
    const quint64 host = rest % p.hostCount_;
    rest /= p.hostCount_;

    quint32 addr = 0;
    for(int i = 3; i >= 0; --i){
        const auto& values = p.octets_[size_t(i)];
        addr |= quint32(values[size_t(rest % values.size())]) << (24 - 8 * i);
        rest /= values.size();
    }

    out->address = addr + quint32(host);
    out->port = port;
    return true;
}

// ========================= TargetSequence =========================
quint64 TargetSequence::size() const {
    quint64 n = 0;
    for(const auto& p : patterns_) n += p.size();
    return n;
}

bool TargetSequence::Cursor::next(Target* out){
    while(index_ < seq_->patterns_.size()){
        if(!inner_) inner_ = seq_->patterns_[index_].cursor();
        if(inner_->next(out)) return true;
        inner_.reset();
        ++index_;
    }
    return false;
}
