#include "brute_forcer.h"
#include "app_log.h"

#include <QElapsedTimer>
#include <QMutexLocker>
#include <QSemaphore>
#include <QThreadPool>
#include <QUrl>
#include <QtConcurrent>

QString FoundCredential::url(const QString& path) const {
    const QString uri = rtspUri(target.host(), target.port, path);
    if(noAuthRequired) return uri;
    const QString userInfo = QString::fromLatin1(QUrl::toPercentEncoding(credential.username)) + ":"
                           + QString::fromLatin1(QUrl::toPercentEncoding(credential.password)) + "@";
    return QString(uri).insert(int(qstrlen("rtsp://")), userInfo);
}

// ========================= 결과 모음 =========================
bool RunResultSet::insert(const FoundCredential& found){
    QMutexLocker lock(&mutex_);
    for(const auto& e : entries_){
        if(e.target == found.target && e.credential == found.credential) return false;
    }
    entries_.push_back(found);
    targets_.insert(found.target.key());
    return true;
}

std::vector<FoundCredential> RunResultSet::snapshot() const {
    QMutexLocker lock(&mutex_);
    return entries_;
}

bool RunResultSet::containsTarget(const Target& target) const {
    QMutexLocker lock(&mutex_);
    return targets_.contains(target.key());
}

int RunResultSet::size() const {
    QMutexLocker lock(&mutex_);
    return int(entries_.size());
}

void RunResultSet::clear(){
    QMutexLocker lock(&mutex_);
    entries_.clear();
    targets_.clear();
}

QString RunTally::toString() const {
    return QString("%1/%2 probes in %3 s (%4/s): %5 valid, %6 invalid, %7 network errors, %8 protocol errors, %9 skipped%10")
        .arg(completed).arg(scheduled)
        .arg(elapsedMs / 1000.0, 0, 'f', 1)
        .arg(throughput(), 0, 'f', 1)
        .arg(valid).arg(invalid).arg(networkErrors).arg(protocolErrors).arg(skipped)
        .arg(interrupted ? QString(", interrupted") : QString());
}

// ========================= 실행 =========================
struct BruteForcer::Counters {
    quint64 scheduled = 0;
    std::atomic<quint64> completed{0};
    std::atomic<quint64> valid{0};
    std::atomic<quint64> invalid{0};
    std::atomic<quint64> networkErrors{0};
    std::atomic<quint64> protocolErrors{0};
    std::atomic<quint64> skipped{0};

    quint64 remaining() const { return scheduled - completed.load() - skipped.load(); }
};

BruteForcer::BruteForcer(BruteOptions options, TransportFactory factory)
    : options_(std::move(options)), factory_(std::move(factory))
{
    if(options_.maxConcurrent < 1) options_.maxConcurrent = 1;
}

void BruteForcer::probeOne(const Target& target, const Credential& credential, Counters& c){
    if(options_.stopOnSuccess && results_.containsTarget(target)){
        ++c.skipped;
        return;
    }

    std::unique_ptr<RtspTransport> transport = factory_();
    const ProbeOutcome o = probeCredential(target, credential, *transport, options_.probe);
    transport.reset();

    switch(o.kind){
    case OutcomeKind::CredentialValid: {
        ++c.valid;
        FoundCredential found{ target, credential, o.noAuthRequired };
        if(results_.insert(found)){
            qCInfo(lcBrute).noquote() << "found" << found.url(options_.probe.path);
            if(onFound_) onFound_(found);
        }
        break;
    }
    case OutcomeKind::CredentialInvalid:
        ++c.invalid;
        break;
    case OutcomeKind::NetworkError:
        ++c.networkErrors;
        qCDebug(lcBrute).noquote() << target.toString() << credential.username << "network error:" << o.reason;
        break;
    case OutcomeKind::ProtocolError:
        ++c.protocolErrors;
        qCDebug(lcBrute).noquote() << target.toString() << credential.username << "protocol error:" << o.reason;
        break;
    }
    ++c.completed;
    qCDebug(lcBrute) << c.remaining() << "remaining";
}

RunTally BruteForcer::run(const TargetSequence& targets, const CredentialList& credentials){
    QElapsedTimer timer; timer.start();
    results_.clear();
    Counters c;
    c.scheduled = targets.size() * credentials.size();

    const int limit = options_.maxConcurrent;
    QThreadPool pool;
    pool.setMaxThreadCount(limit);
    QSemaphore gate(limit);    // 동시에 진행 중인 프로브 수 상한

    qCInfo(lcBrute) << "starting" << c.scheduled << "probes," << limit << "concurrent";

    auto admit = [&]() -> bool {
        while(!gate.tryAcquire(1, 100)){
            if(stopRequested()) return false;
        }
        if(stopRequested()){ gate.release(); return false; }
        return true;
    };

    Target target;
    auto cursor = targets.cursor();
    bool admitting = !stopRequested();
    while(admitting && cursor.next(&target)){
        for(quint64 i = 0; i < credentials.size(); ++i){
            if(options_.stopOnSuccess && results_.containsTarget(target)){
                c.skipped += credentials.size() - i;
                qCDebug(lcBrute) << target.toString() << "already cracked, skipping" << (credentials.size() - i);
                break;
            }
            if(!admit()){ admitting = false; break; }

            const Credential credential = credentials.at(i);
            QFuture<void> fut = QtConcurrent::run(&pool, [this, target, credential, &c, &gate]{
                QSemaphoreReleaser release(gate);
                probeOne(target, credential, c);
            });
            Q_UNUSED(fut);
        }
    }
    pool.waitForDone();
    // 이번 실행에 대한 중단 요청은 여기서 소비
    stop_.store(false);

    RunTally t;
    t.scheduled = c.scheduled;
    t.completed = c.completed.load();
    t.valid = c.valid.load();
    t.invalid = c.invalid.load();
    t.networkErrors = c.networkErrors.load();
    t.protocolErrors = c.protocolErrors.load();
    t.skipped = c.skipped.load();
    t.elapsedMs = timer.elapsed();
    t.interrupted = t.completed + t.skipped < t.scheduled;

    if(t.interrupted) qCWarning(lcBrute) << "stopped before completion," << c.remaining() << "probes not run";
    qCInfo(lcBrute).noquote() << t.toString();
    return t;
}
