// rtspaudit
// - 대상 패턴(192.168.1.{1-254}:554, 10.0.0.0/24 ...) × 사용자 × 비밀번호 조합으로 RTSP DESCRIBE 인증 확인
// - Basic / Digest(MD5, SHA-256, -sess, qop) 지원, 조합당 요청 최대 2번
// - 동시 프로브 수 제한(QThreadPool + QSemaphore), Ctrl+C 로 중단하면 진행 중인 것만 마치고 종료
// - 찾은 URL 은 로그로, 선택적으로 XML 보고서 / OpenCV 로 프레임 확인
#include "app_config.h"
#include "app_log.h"
#include "brute_forcer.h"
#include "list_reader.h"
#include "result_report.h"
#include "stream_verifier.h"

#include <QCoreApplication>
#include <QTextStream>

#include <atomic>
#include <csignal>
#include <cstdio>

#ifndef RTSPAUDIT_VERSION
#define RTSPAUDIT_VERSION "0.0.0"
#endif

enum ExitCode { EXIT_FOUND = 0, EXIT_ERROR = 1, EXIT_NOTHING_FOUND = 2, EXIT_INTERRUPTED = 130 };

// ========================= 중단 =========================
static std::atomic<BruteForcer*> g_brute{nullptr};

static void onSignal(int sig){
    if(BruteForcer* b = g_brute.load()) b->requestStop();
    std::signal(sig, SIG_DFL);  // 두 번째는 바로 종료
}

static int fatal(const QString& why){
    qCCritical(lcApp).noquote() << why;
    return EXIT_ERROR;
}

int main(int argc, char** argv){
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("RtspAudit");
    QCoreApplication::setApplicationName("rtspaudit");
    QCoreApplication::setApplicationVersion(RTSPAUDIT_VERSION);

    // 설정을 읽기 전의 오류도 같은 형식으로
    setupLogging(LogLevel::Info);

    QString err;
    CommandLine cmd;
    if(!cmd.parse(app.arguments(), &err)) return fatal(err);
    if(cmd.helpRequested()){
        QTextStream(stdout) << cmd.helpText();
        return EXIT_FOUND;
    }
    if(cmd.versionRequested()){
        QTextStream(stdout) << QCoreApplication::applicationName() << " " << RTSPAUDIT_VERSION << "\n";
        return EXIT_FOUND;
    }

    AppConfig cfg;
    if(!resolveConfig(cmd, &cfg, &err)) return fatal(err);
    if(!setupLogging(cfg.logLevel, cfg.logFile, &err)) return fatal(err);

    // 목록
    QStringList users, passwords, targetLines;
    if(!loadList(cfg.usersFile, cfg.usersString, &users, &err)) return fatal(err);
    if(!loadList(cfg.passwordsFile, cfg.passwordsString, &passwords, &err)) return fatal(err);
    if(!loadList(cfg.ipsFile, cfg.ipsString, &targetLines, &err)) return fatal(err);

    TargetSequence targets;
    if(!buildTargetSequence(targetLines, &targets, &err)) return fatal(err);
    const CredentialList credentials(users, passwords);
    if(credentials.isEmpty()) return fatal("username or password list is empty");

    qCInfo(lcApp) << users.size() << "usernames," << passwords.size() << "passwords,"
                  << targets.size() << "targets";

    // 실행
    BruteOptions options;
    options.maxConcurrent = cfg.maxConcurrent;
    options.stopOnSuccess = cfg.stopOnSuccess;
    options.probe.path = cfg.path;

    TransportTimeouts timeouts;
    timeouts.connectMs = cfg.connectTimeoutMs;
    timeouts.ioMs = cfg.ioTimeoutMs;

    BruteForcer brute(options, tcpTransportFactory(timeouts));
    g_brute.store(&brute);
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    const RunTally tally = brute.run(targets, credentials);

    g_brute.store(nullptr);
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    // 결과
    std::vector<ReportEntry> entries;
    for(const FoundCredential& f : brute.results().snapshot()){
        ReportEntry e;
        e.found = f;
        const QString url = f.url(cfg.path);
        if(cfg.verifyStream){
            QString why;
            const bool ok = verifyStream(url, cfg.ioTimeoutMs, &why);
            e.stream = ok ? StreamCheck::Ok : StreamCheck::Failed;
            if(ok) qCInfo(lcApp).noquote() << "stream ok:" << url;
            else   qCWarning(lcApp).noquote() << "stream failed:" << url << "-" << why;
        }
        qCInfo(lcApp).noquote() << (f.noAuthRequired ? "open (no auth):" : "valid:") << url;
        entries.push_back(e);
    }

    if(!cfg.reportFile.isEmpty() && !writeXmlReport(cfg.reportFile, tally, entries, cfg.path, &err))
        return fatal(err);

    qCInfo(lcApp).noquote() << "summary:" << tally.toString();

    if(tally.interrupted) return EXIT_INTERRUPTED;
    return entries.empty() ? EXIT_NOTHING_FOUND : EXIT_FOUND;
}
