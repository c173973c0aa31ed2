#include "rtsp_message.h"

#include <gtest/gtest.h>

TEST(RtspMessage, ParsesChallengeResponse){
    const QByteArray raw =
        "RTSP/1.0 401 Unauthorized\r\n"
        "CSeq: 1\r\n"
        "WWW-Authenticate: Digest realm=\"cam\", nonce=\"abc\"\r\n"
        "www-authenticate: Basic realm=\"cam\"\r\n"
        "\r\n";
    RtspResponse r;
    ASSERT_EQ(parseRtspResponse(raw, &r), ParseResult::Complete);
    EXPECT_EQ(r.status, 401);
    EXPECT_EQ(r.reason, QByteArray("Unauthorized"));
    EXPECT_EQ(r.header("cseq"), QByteArray("1"));
    EXPECT_EQ(r.headerValues("WWW-AUTHENTICATE").size(), 2);
}

TEST(RtspMessage, WaitsForHeadersAndBody){
    const QByteArray raw =
        "RTSP/1.0 200 OK\r\n"
        "Content-Length: 10\r\n"
        "\r\n"
        "v=0\r\no=- 1";
    RtspResponse r;
    EXPECT_EQ(parseRtspResponse(raw.left(12), &r), ParseResult::Incomplete);
    EXPECT_EQ(parseRtspResponse(raw.left(raw.size() - 3), &r), ParseResult::Incomplete);
    ASSERT_EQ(parseRtspResponse(raw, &r), ParseResult::Complete);
    EXPECT_EQ(r.body, QByteArray("v=0\r\no=- 1"));
}

TEST(RtspMessage, AcceptsBareLineFeeds){
    RtspResponse r;
    ASSERT_EQ(parseRtspResponse("RTSP/1.0 200 OK\nCSeq: 2\n\n", &r), ParseResult::Complete);
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.header("CSeq"), QByteArray("2"));
}

TEST(RtspMessage, FoldsContinuationLines){
    RtspResponse r;
    ASSERT_EQ(parseRtspResponse("RTSP/1.0 401 Unauthorized\r\n"
                                "WWW-Authenticate: Digest realm=\"a\",\r\n"
                                "  nonce=\"b\"\r\n\r\n", &r),
              ParseResult::Complete);
    EXPECT_EQ(r.header("WWW-Authenticate"), QByteArray("Digest realm=\"a\", nonce=\"b\""));
}

TEST(RtspMessage, RejectsNonRtsp){
    RtspResponse r;
    QString err;
    EXPECT_EQ(parseRtspResponse("HTTP/1.1 200 OK\r\n\r\n", &r, &err), ParseResult::Malformed);
    EXPECT_FALSE(err.isEmpty());
    EXPECT_EQ(parseRtspResponse("RTSP/1.0 abc\r\n\r\n", &r), ParseResult::Malformed);
    EXPECT_EQ(parseRtspResponse("RTSP/1.0 200 OK\r\nno colon here\r\n\r\n", &r), ParseResult::Malformed);
    EXPECT_EQ(parseRtspResponse("RTSP/1.0 200 OK\r\nContent-Length: -1\r\n\r\n", &r), ParseResult::Malformed);
}

TEST(RtspMessage, CapsHeaderSize){
    RtspResponse r;
    const QByteArray junk(kMaxResponseBytes + 1, 'x');
    EXPECT_EQ(parseRtspResponse(junk, &r), ParseResult::Malformed);
}

TEST(RtspMessage, UriAndRequest){
    EXPECT_EQ(rtspUri("10.0.0.1", 554, QString()), QString("rtsp://10.0.0.1:554"));
    EXPECT_EQ(rtspUri("10.0.0.1", 8554, "live/ch0"), QString("rtsp://10.0.0.1:8554/live/ch0"));

    const QByteArray req = buildDescribeRequest("rtsp://10.0.0.1:554", 2, "ua/1.0", "Basic eDp5");
    EXPECT_TRUE(req.startsWith("DESCRIBE rtsp://10.0.0.1:554 RTSP/1.0\r\n"));
    EXPECT_TRUE(req.contains("CSeq: 2\r\n"));
    EXPECT_TRUE(req.contains("User-Agent: ua/1.0\r\n"));
    EXPECT_TRUE(req.contains("Authorization: Basic eDp5\r\n"));
    EXPECT_TRUE(req.endsWith("\r\n\r\n"));

    EXPECT_FALSE(buildDescribeRequest("rtsp://h:1", 1, "ua").contains("Authorization"));
    EXPECT_FALSE(randomUserAgent().isEmpty());
}
