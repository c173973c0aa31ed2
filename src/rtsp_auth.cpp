#include "rtsp_auth.h"

#include <array>
#include <random>

QString schemeName(const AuthChallenge& challenge){
    return std::holds_alternative<DigestChallenge>(challenge) ? QStringLiteral("Digest") : QStringLiteral("Basic");
}

// ========================= 파라미터 파싱 =========================
QMap<QByteArray, QByteArray> parseAuthParams(const QByteArray& text){
    QMap<QByteArray, QByteArray> kv;
    int pos = 0;
    const int n = text.size();
    while(pos < n){
        while(pos < n && (text[pos] == ' ' || text[pos] == '\t' || text[pos] == ',')) ++pos;
        const int eq = text.indexOf('=', pos);
        if(eq < 0) break;
        const QByteArray key = text.mid(pos, eq - pos).trimmed().toLower();
        pos = eq + 1;
        while(pos < n && (text[pos] == ' ' || text[pos] == '\t')) ++pos;

        QByteArray value;
        if(pos < n && text[pos] == '"'){
            ++pos;
            while(pos < n && text[pos] != '"'){
                if(text[pos] == '\\' && pos + 1 < n) ++pos;
                value += text[pos++];
            }
            ++pos;  // 닫는 따옴표
        } else {
            int comma = text.indexOf(',', pos);
            if(comma < 0) comma = n;
            value = text.mid(pos, comma - pos).trimmed();
            pos = comma;
        }
        if(!key.isEmpty()) kv.insert(key, value);
    }
    return kv;
}

// qop="auth,auth-int" 같은 목록에서 하나 고르기
static QByteArray chooseQop(const QByteArray& offered){
    QByteArray chosen;
    for(const QByteArray& raw : offered.split(',')){
        const QByteArray q = raw.trimmed().toLower();
        if(q == "auth") return q;
        if(q == "auth-int") chosen = q;
    }
    return chosen;
}

std::optional<AuthChallenge> parseChallengeHeader(const QByteArray& value, QString* errOut){
    const QByteArray v = value.trimmed();
    const int sp = v.indexOf(' ');
    const QByteArray scheme = (sp < 0 ? v : v.left(sp)).toLower();
    const auto params = parseAuthParams(sp < 0 ? QByteArray() : v.mid(sp + 1));

    if(scheme == "basic")
        return AuthChallenge{ BasicChallenge{ params.value("realm") } };

    if(scheme == "digest"){
        DigestChallenge d;
        d.realm = params.value("realm");
        d.nonce = params.value("nonce");
        d.opaque = params.value("opaque");
        d.algorithm = params.value("algorithm");
        d.stale = params.value("stale").toLower() == "true";
        if(d.realm.isEmpty() || d.nonce.isEmpty()){
            if(errOut) *errOut = "Digest challenge without realm or nonce";
            return std::nullopt;
        }
        if(params.contains("qop")){
            d.qop = chooseQop(params.value("qop"));
            if(d.qop.isEmpty()){
                if(errOut) *errOut = QString("unsupported qop: %1").arg(QString::fromLatin1(params.value("qop")));
                return std::nullopt;
            }
        }
        if(!digestAlgorithm(d.algorithm)){
            if(errOut) *errOut = QString("unsupported digest algorithm: %1").arg(QString::fromLatin1(d.algorithm));
            return std::nullopt;
        }
        return AuthChallenge{ d };
    }

    if(errOut) *errOut = QString("unsupported auth scheme: %1").arg(QString::fromLatin1(scheme.isEmpty() ? v : scheme));
    return std::nullopt;
}

std::optional<AuthChallenge> selectChallenge(const RtspResponse& response, QString* errOut){
    const QList<QByteArray> values = response.headerValues("WWW-Authenticate");
    if(values.isEmpty()){
        if(errOut) *errOut = "no WWW-Authenticate header in 401 response";
        return std::nullopt;
    }

    std::optional<AuthChallenge> basic;
    QString lastErr;
    for(const QByteArray& value : values){
        QString err;
        auto c = parseChallengeHeader(value, &err);
        if(!c){ lastErr = err; continue; }
        if(std::holds_alternative<DigestChallenge>(*c)) return c;
        if(!basic) basic = c;
    }
    if(basic) return basic;
    if(errOut) *errOut = lastErr;
    return std::nullopt;
}

// ========================= Digest =========================
std::optional<DigestAlgorithm> digestAlgorithm(const QByteArray& name){
    QByteArray n = name.trimmed().toUpper();
    DigestAlgorithm alg;
    if(n.endsWith("-SESS")){ alg.session = true; n.chop(5); }
    if(n.isEmpty() || n == "MD5")       alg.hash = QCryptographicHash::Md5;
    else if(n == "SHA-256")             alg.hash = QCryptographicHash::Sha256;
    else return std::nullopt;
    return alg;
}

QByteArray digestResponse(const DigestAlgorithm& algorithm, const DigestInput& in){
    QCryptographicHash hash(algorithm.hash);

    // HA1 = H(username:realm:password)
    hash.addData(in.username); hash.addData(":");
    hash.addData(in.realm);    hash.addData(":");
    hash.addData(in.password);
    QByteArray ha1 = hash.result().toHex();
    if(algorithm.session){
        hash.reset();
        hash.addData(ha1);       hash.addData(":");
        hash.addData(in.nonce);  hash.addData(":");
        hash.addData(in.cnonce);
        ha1 = hash.result().toHex();
    }

    // HA2 = H(method:uri[:H(body)])
    hash.reset();
    hash.addData(in.method); hash.addData(":");
    hash.addData(in.uri);
    if(in.qop == "auth-int"){
        hash.addData(":");
        hash.addData(QCryptographicHash::hash(in.entityBody, algorithm.hash).toHex());
    }
    const QByteArray ha2 = hash.result().toHex();

    // response = H(HA1:nonce[:nc:cnonce:qop]:HA2)
    hash.reset();
    hash.addData(ha1);      hash.addData(":");
    hash.addData(in.nonce); hash.addData(":");
    if(!in.qop.isEmpty()){
        hash.addData(in.nonceCount); hash.addData(":");
        hash.addData(in.cnonce);     hash.addData(":");
        hash.addData(in.qop);        hash.addData(":");
    }
    hash.addData(ha2);
    return hash.result().toHex();
}

QByteArray generateCnonce(){
    std::array<unsigned char, 16> raw{};
    std::random_device rd; std::mt19937 gen(rd()); std::uniform_int_distribution<int> dis(0, 255);
    for(auto& b : raw) b = static_cast<unsigned char>(dis(gen));
    return QByteArray(reinterpret_cast<const char*>(raw.data()), int(raw.size())).toHex();
}

// ========================= Authorization =========================
static QByteArray quoted(const QByteArray& v){
    QByteArray out = v;
    out.replace('\\', "\\\\");
    out.replace('"', "\\\"");
    return '"' + out + '"';
}

QByteArray basicAuthorization(const Credential& credential){
    const QByteArray up = (credential.username + ":" + credential.password).toUtf8();
    return "Basic " + up.toBase64();
}

std::optional<QByteArray> digestAuthorization(const DigestChallenge& challenge, const Credential& credential,
                                              const QByteArray& method, const QByteArray& uri,
                                              const QByteArray& cnonce, QString* errOut)
{
    const auto alg = digestAlgorithm(challenge.algorithm);
    if(!alg){
        if(errOut) *errOut = QString("unsupported digest algorithm: %1").arg(QString::fromLatin1(challenge.algorithm));
        return std::nullopt;
    }

    DigestInput in;
    in.username = credential.username.toUtf8();
    in.password = credential.password.toUtf8();
    in.realm = challenge.realm;
    in.nonce = challenge.nonce;
    in.method = method;
    in.uri = uri;
    in.qop = challenge.qop;
    if(!challenge.qop.isEmpty() || alg->session)
        in.cnonce = cnonce.isEmpty() ? generateCnonce() : cnonce;

    const QByteArray response = digestResponse(*alg, in);

    QByteArray header = "Digest username=" + quoted(in.username)
        + ", realm=" + quoted(challenge.realm)
        + ", nonce=" + quoted(challenge.nonce)
        + ", uri=" + quoted(uri)
        + ", response=" + quoted(response);
    if(!challenge.algorithm.isEmpty()) header += ", algorithm=" + challenge.algorithm;
    if(!challenge.opaque.isEmpty())    header += ", opaque=" + quoted(challenge.opaque);
    if(!challenge.qop.isEmpty())
        header += ", qop=" + challenge.qop + ", nc=" + in.nonceCount + ", cnonce=" + quoted(in.cnonce);
    else if(alg->session)
        header += ", cnonce=" + quoted(in.cnonce);
    return header;
}

namespace {

struct AuthorizationBuilder {
    const Credential& credential;
    const QByteArray& method;
    const QByteArray& uri;
    QString* errOut;

    std::optional<QByteArray> operator()(const BasicChallenge&) const {
        return basicAuthorization(credential);
    }
    std::optional<QByteArray> operator()(const DigestChallenge& d) const {
        return digestAuthorization(d, credential, method, uri, QByteArray(), errOut);
    }
};

} // namespace

std::optional<QByteArray> buildAuthorization(const AuthChallenge& challenge, const Credential& credential,
                                             const QByteArray& method, const QByteArray& uri,
                                             QString* errOut)
{
    return std::visit(AuthorizationBuilder{ credential, method, uri, errOut }, challenge);
}
