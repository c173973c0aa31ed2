#pragma once

#include "app_log.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include <QStringList>

// 실행에 필요한 설정 전부. 기본값 → config.ini → 명령행 순으로 덮어쓴다.
struct AppConfig {
    // 목록마다 파일/문자열 중 하나만
    QString usersFile = "users.txt";
    QString usersString;
    QString passwordsFile = "passwords.txt";
    QString passwordsString;
    QString ipsFile = "iplist.txt";
    QString ipsString;

    int maxConcurrent = 5;
    QString path;                   // 요청 경로, 비어 있으면 rtsp://host:port
    int connectTimeoutMs = 5000;
    int ioTimeoutMs = 10000;
    bool stopOnSuccess = false;

    QString reportFile;             // XML 보고서
    bool verifyStream = false;      // 찾은 URL 로 프레임 하나 읽어 보기

    LogLevel logLevel = LogLevel::Info;
    QString logFile;
};

static constexpr const char* DEFAULT_CONFIG_FILE = "config.ini";

// INI 파일 하나를 cfg 위에 덮어쓴다. required=false 이면 파일이 없어도 성공
bool loadConfigFile(const QString& path, AppConfig* cfg, bool required, QString* errOut = nullptr);

bool validateConfig(const AppConfig& cfg, QString* errOut = nullptr);

// ========================= 명령행 =========================
class CommandLine {
public:
    CommandLine();

    bool parse(const QStringList& arguments, QString* errOut = nullptr);

    bool helpRequested() const { return parser_.isSet(helpOpt_); }
    bool versionRequested() const { return parser_.isSet(versionOpt_); }
    QString helpText() const { return parser_.helpText(); }

    // --config, 없으면 빈 문자열
    QString configPath() const { return parser_.value(configOpt_); }

    // 명령행에 준 값만 cfg 에 덮어쓴다
    bool applyTo(AppConfig* cfg, QString* errOut = nullptr) const;

private:
    QCommandLineParser parser_;
    QCommandLineOption helpOpt_;
    QCommandLineOption versionOpt_;
    QCommandLineOption configOpt_;
    QCommandLineOption usersFileOpt_, usersStringOpt_;
    QCommandLineOption passwordsFileOpt_, passwordsStringOpt_;
    QCommandLineOption ipsFileOpt_, ipsStringOpt_;
    QCommandLineOption maxConcurrentOpt_;
    QCommandLineOption pathOpt_;
    QCommandLineOption connectTimeoutOpt_, ioTimeoutOpt_;
    QCommandLineOption stopOnSuccessOpt_;
    QCommandLineOption reportOpt_;
    QCommandLineOption verifyStreamOpt_;
    QCommandLineOption logLevelOpt_, logFileOpt_;
};

// 기본값 + 설정 파일 + 명령행 → 검증된 AppConfig
bool resolveConfig(const CommandLine& cmd, AppConfig* out, QString* errOut = nullptr);
