#include "rtsp_auth.h"

#include <gtest/gtest.h>

namespace {

DigestInput rfc2617(){
    DigestInput in;
    in.username = "Mufasa";
    in.password = "Circle Of Life";
    in.realm = "testrealm@host.com";
    in.nonce = "dcd98b7102dd2f0e8b11d0f600bfb0c093";
    in.method = "GET";
    in.uri = "/dir/index.html";
    in.qop = "auth";
    in.cnonce = "0a4f113b";
    return in;
}

RtspResponse challengeResponse(const QList<QByteArray>& values){
    RtspResponse r;
    r.status = 401;
    for(const auto& v : values) r.headers.append(qMakePair(QByteArray("WWW-Authenticate"), v));
    return r;
}

} // namespace

// ========================= 파라미터 =========================
TEST(AuthParams, QuotedAndBareValues){
    const auto kv = parseAuthParams("Realm=\"IP Camera\", nonce=abc123 ,stale=FALSE, opaque=\"a\\\"b\"");
    EXPECT_EQ(kv.value("realm"), QByteArray("IP Camera"));
    EXPECT_EQ(kv.value("nonce"), QByteArray("abc123"));
    EXPECT_EQ(kv.value("stale"), QByteArray("FALSE"));
    EXPECT_EQ(kv.value("opaque"), QByteArray("a\"b"));
}

TEST(AuthChallenge, ParsesDigest){
    QString err;
    auto c = parseChallengeHeader("Digest realm=\"cam\", nonce=\"n1\", opaque=\"o\", qop=\"auth,auth-int\", algorithm=MD5-sess", &err);
    ASSERT_TRUE(c.has_value()) << err.toStdString();
    ASSERT_TRUE(std::holds_alternative<DigestChallenge>(*c));
    const auto& d = std::get<DigestChallenge>(*c);
    EXPECT_EQ(d.realm, QByteArray("cam"));
    EXPECT_EQ(d.nonce, QByteArray("n1"));
    EXPECT_EQ(d.opaque, QByteArray("o"));
    EXPECT_EQ(d.qop, QByteArray("auth"));
    EXPECT_EQ(d.algorithm, QByteArray("MD5-sess"));
    EXPECT_EQ(schemeName(*c), QString("Digest"));
}

TEST(AuthChallenge, ParsesBasic){
    auto c = parseChallengeHeader("basic realm=\"x\"");
    ASSERT_TRUE(c.has_value());
    EXPECT_TRUE(std::holds_alternative<BasicChallenge>(*c));
    EXPECT_EQ(std::get<BasicChallenge>(*c).realm, QByteArray("x"));
}

TEST(AuthChallenge, RejectsUnusableChallenges){
    QString err;
    EXPECT_FALSE(parseChallengeHeader("NTLM", &err).has_value());
    EXPECT_TRUE(err.contains("unsupported auth scheme"));
    EXPECT_FALSE(parseChallengeHeader("Digest realm=\"a\"", &err).has_value());
    EXPECT_FALSE(parseChallengeHeader("Digest realm=\"a\", nonce=\"b\", algorithm=SHA-512-256", &err).has_value());
    EXPECT_TRUE(err.contains("algorithm"));
    EXPECT_FALSE(parseChallengeHeader("Digest realm=\"a\", nonce=\"b\", qop=\"auth-conf\"", &err).has_value());
    EXPECT_TRUE(err.contains("qop"));
}

TEST(AuthChallenge, DigestPreferredOverBasic){
    auto c = selectChallenge(challengeResponse({ "Basic realm=\"a\"", "Digest realm=\"a\", nonce=\"b\"" }));
    ASSERT_TRUE(c.has_value());
    EXPECT_TRUE(std::holds_alternative<DigestChallenge>(*c));

    c = selectChallenge(challengeResponse({ "Negotiate", "Basic realm=\"a\"" }));
    ASSERT_TRUE(c.has_value());
    EXPECT_TRUE(std::holds_alternative<BasicChallenge>(*c));
}

TEST(AuthChallenge, MissingHeaderIsAnError){
    QString err;
    EXPECT_FALSE(selectChallenge(challengeResponse({}), &err).has_value());
    EXPECT_TRUE(err.contains("WWW-Authenticate"));
}

// ========================= Digest =========================
TEST(Digest, LegacyWithoutQop){
    DigestInput in;
    in.username = "admin";
    in.password = "123456";
    in.realm = "RTSP SERVER";
    in.nonce = "72fb3f3f23ded5a9d8f9be5a4535bf84";
    in.method = "DESCRIBE";
    in.uri = "rtsp://60.243.26.171:555";
    EXPECT_EQ(digestResponse(DigestAlgorithm{}, in), QByteArray("bacab71a291d142b597913dc07633ea6"));
}

TEST(Digest, Rfc2617QopAuth){
    EXPECT_EQ(digestResponse(DigestAlgorithm{}, rfc2617()), QByteArray("6629fae49393a05397450978507c4ef1"));
}

TEST(Digest, Md5Session){
    const auto alg = digestAlgorithm("md5-sess");
    ASSERT_TRUE(alg.has_value());
    EXPECT_TRUE(alg->session);
    EXPECT_EQ(digestResponse(*alg, rfc2617()), QByteArray("8e3825c57e897f5a0dec6c2d4e5059d0"));
}

TEST(Digest, AuthIntHashesEmptyBody){
    DigestInput in = rfc2617();
    in.qop = "auth-int";
    EXPECT_EQ(digestResponse(DigestAlgorithm{}, in), QByteArray("5e6610ecf9ba3017a4870ad48e3ad30b"));
}

TEST(Digest, Rfc7616Sha256){
    DigestInput in;
    in.username = "Mufasa";
    in.password = "Circle of Life";
    in.realm = "http-auth@example.org";
    in.nonce = "7ypf/xlj9XXwfDPEoM4URrv/xwf94BcCAzFZH4GiTo0v";
    in.method = "GET";
    in.uri = "/dir/index.html";
    in.qop = "auth";
    in.cnonce = "f2/wE4q74E6zIJEtWaHKaf5wv/H5QzzpXusqGemxURZJ";
    const auto alg = digestAlgorithm("SHA-256");
    ASSERT_TRUE(alg.has_value());
    EXPECT_EQ(digestResponse(*alg, in),
              QByteArray("753927fa0e85d155564e2e272a28d1802ca10daf4496794697cf8db5856cb6c1"));
}

TEST(Digest, CnonceIsRandomHex){
    const QByteArray a = generateCnonce(), b = generateCnonce();
    EXPECT_EQ(a.size(), 32);
    EXPECT_NE(a, b);
}

// ========================= Authorization =========================
TEST(Authorization, Basic){
    EXPECT_EQ(basicAuthorization({ "admin", "12345" }), QByteArray("Basic YWRtaW46MTIzNDU="));
    EXPECT_EQ(basicAuthorization({ "Aladdin", "open sesame" }), QByteArray("Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ=="));
}

TEST(Authorization, DigestHeaderWithQop){
    DigestChallenge d;
    d.realm = "testrealm@host.com";
    d.nonce = "dcd98b7102dd2f0e8b11d0f600bfb0c093";
    d.opaque = "5ccc069c403ebaf9f0171e9517f40e41";
    d.qop = "auth";
    const auto h = digestAuthorization(d, { "Mufasa", "Circle Of Life" }, "GET", "/dir/index.html", "0a4f113b");
    ASSERT_TRUE(h.has_value());
    EXPECT_TRUE(h->startsWith("Digest username=\"Mufasa\""));
    EXPECT_TRUE(h->contains("response=\"6629fae49393a05397450978507c4ef1\""));
    EXPECT_TRUE(h->contains("opaque=\"5ccc069c403ebaf9f0171e9517f40e41\""));
    EXPECT_TRUE(h->contains("qop=auth, nc=00000001, cnonce=\"0a4f113b\""));
    EXPECT_FALSE(h->contains("algorithm="));
}

TEST(Authorization, DigestHeaderWithoutQop){
    DigestChallenge d;
    d.realm = "RTSP SERVER";
    d.nonce = "72fb3f3f23ded5a9d8f9be5a4535bf84";
    d.algorithm = "MD5";
    const auto h = buildAuthorization(AuthChallenge{ d }, { "admin", "123456" }, "DESCRIBE", "rtsp://60.243.26.171:555");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(*h, QByteArray("Digest username=\"admin\", realm=\"RTSP SERVER\", "
                             "nonce=\"72fb3f3f23ded5a9d8f9be5a4535bf84\", uri=\"rtsp://60.243.26.171:555\", "
                             "response=\"bacab71a291d142b597913dc07633ea6\", algorithm=MD5"));
}

TEST(Authorization, BasicThroughVariant){
    const auto h = buildAuthorization(AuthChallenge{ BasicChallenge{ "cam" } }, { "admin", "12345" }, "DESCRIBE", "rtsp://x:554");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(*h, QByteArray("Basic YWRtaW46MTIzNDU="));
}
