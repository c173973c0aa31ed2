#pragma once

#include <QString>
#include <QtGlobal>

#include <array>
#include <optional>
#include <vector>

// 하나의 구체적인 (IPv4, port) 대상
struct Target {
    quint32 address = 0;
    quint16 port = 0;

    QString host() const;       // "a.b.c.d"
    QString toString() const;   // "a.b.c.d:port"
    quint64 key() const { return (quint64(address) << 16) | port; }

    bool operator==(const Target& o) const { return address == o.address && port == o.port; }
    bool operator!=(const Target& o) const { return !(*this == o); }
    bool operator<(const Target& o) const { return key() < o.key(); }
};

struct PatternError {
    QString segment;    // 문제가 된 조각 (octet 1..4, mask, port, pattern)
    QString message;
    QString toString() const { return QString("%1: %2").arg(segment, message); }
};

// ============================================================================
// 주소/포트 패턴
//   pattern  := octet "." octet "." octet "." octet [ "/" bits ] [ ":" values ]
//   octet    := values
//   values   := item ( "," item )*
//   item     := number | number "-" number | "{" values "}"
// 예) 192.168.1.{1-3}, 10.{1,5,10-20}.0.1:{554,8554}, 192.168.1.0/30
//
// 옥텟/포트별 값 집합만 미리 만들고, 전체 조합은 Cursor 가 하나씩 생성한다.
// mask 가 있으면 각 후보 주소의 네트워크(상위 bits)를 구하고 그 블록 전체를 만든다.
// ============================================================================
class TargetPattern {
public:
    static constexpr quint16 kDefaultPort = 554;

    static std::optional<TargetPattern> parse(const QString& text, PatternError* err = nullptr);

    // 포트 부분만 ("554", "{8000-8002}", "80,443")
    static bool parsePorts(const QString& text, std::vector<quint16>* out, PatternError* err = nullptr);

    // DNS 로 풀린 호스트처럼 주소가 이미 정해진 경우
    static TargetPattern fromAddress(quint32 address, std::vector<quint16> ports = {kDefaultPort});

    const QString& text() const { return text_; }
    quint64 size() const;
    int maskBits() const { return maskBits_; }
    const std::vector<quint16>& ports() const { return ports_; }

    class Cursor {
    public:
        explicit Cursor(const TargetPattern* pattern) : pattern_(pattern) {}
        bool next(Target* out);
        void reset() { pos_ = 0; }
        quint64 position() const { return pos_; }
    private:
        const TargetPattern* pattern_ = nullptr;
        quint64 pos_ = 0;
    };

    Cursor cursor() const { return Cursor(this); }

private:
    TargetPattern() = default;

    QString text_;
    std::array<std::vector<quint8>, 4> octets_;
    std::vector<quint16> ports_;
    int maskBits_ = -1;         // -1 = mask 없음
    quint64 hostCount_ = 1;     // mask 블록 하나의 주소 개수
};

// 여러 패턴을 이어 붙인 대상 열. 패턴 간 중복 제거는 하지 않는다.
class TargetSequence {
public:
    void append(TargetPattern pattern) { patterns_.push_back(std::move(pattern)); }
    bool isEmpty() const { return patterns_.empty(); }
    int patternCount() const { return int(patterns_.size()); }
    const TargetPattern& pattern(int i) const { return patterns_[size_t(i)]; }
    quint64 size() const;

    class Cursor {
    public:
        explicit Cursor(const TargetSequence* seq) : seq_(seq) {}
        bool next(Target* out);
    private:
        const TargetSequence* seq_ = nullptr;
        size_t index_ = 0;
        std::optional<TargetPattern::Cursor> inner_;
    };

    Cursor cursor() const { return Cursor(this); }

private:
    std::vector<TargetPattern> patterns_;
};
