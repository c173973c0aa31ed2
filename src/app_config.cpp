#include "app_config.h"

#include <QFileInfo>
#include <QSettings>

// 한 계층 안에서 file/string 을 같이 주면 오류, 하나만 주면 아래 계층의 둘 다를 대체
static bool applyListLayer(const QString& name,
                           bool hasFile, const QString& file,
                           bool hasString, const QString& str,
                           QString* cfgFile, QString* cfgString, QString* errOut)
{
    if(hasFile && hasString){
        if(errOut) *errOut = QString("%1_file and %1_string are mutually exclusive").arg(name);
        return false;
    }
    if(hasFile){ *cfgFile = file; cfgString->clear(); }
    if(hasString){ *cfgString = str; cfgFile->clear(); }
    return true;
}

static bool toPositiveInt(const QString& key, const QString& text, int* out, QString* errOut){
    bool ok = false;
    const int v = text.trimmed().toInt(&ok);
    if(!ok || v < 1){
        if(errOut) *errOut = QString("%1: expected a positive integer, got '%2'").arg(key, text);
        return false;
    }
    *out = v;
    return true;
}

// ========================= 설정 파일 =========================
bool loadConfigFile(const QString& path, AppConfig* cfg, bool required, QString* errOut){
    if(!QFileInfo::exists(path)){
        if(!required) return true;
        if(errOut) *errOut = QString("config file %1 not found").arg(path);
        return false;
    }

    QSettings st(path, QSettings::IniFormat);
    if(st.status() != QSettings::NoError){
        if(errOut) *errOut = QString("cannot parse config file %1").arg(path);
        return false;
    }

    auto str = [&](const char* key){ return st.value(key).toString(); };
    auto list = [&](const char* name, QString* f, QString* s){
        const QString fk = QString("%1_file").arg(name), sk = QString("%1_string").arg(name);
        return applyListLayer(name, st.contains(fk), st.value(fk).toString(),
                              st.contains(sk), st.value(sk).toString(), f, s, errOut);
    };
    if(!list("users", &cfg->usersFile, &cfg->usersString)) return false;
    if(!list("passwords", &cfg->passwordsFile, &cfg->passwordsString)) return false;
    if(!list("ips", &cfg->ipsFile, &cfg->ipsString)) return false;

    if(st.contains("max_concurrent") && !toPositiveInt("max_concurrent", str("max_concurrent"), &cfg->maxConcurrent, errOut)) return false;
    if(st.contains("connect_timeout_ms") && !toPositiveInt("connect_timeout_ms", str("connect_timeout_ms"), &cfg->connectTimeoutMs, errOut)) return false;
    if(st.contains("io_timeout_ms") && !toPositiveInt("io_timeout_ms", str("io_timeout_ms"), &cfg->ioTimeoutMs, errOut)) return false;
    if(st.contains("path")) cfg->path = str("path");
    if(st.contains("stop_on_success")) cfg->stopOnSuccess = st.value("stop_on_success").toBool();
    if(st.contains("report_file")) cfg->reportFile = str("report_file");
    if(st.contains("verify_stream")) cfg->verifyStream = st.value("verify_stream").toBool();
    if(st.contains("log_file")) cfg->logFile = str("log_file");
    if(st.contains("log_level") && !parseLogLevel(str("log_level"), &cfg->logLevel)){
        if(errOut) *errOut = QString("log_level: unknown level '%1'").arg(str("log_level"));
        return false;
    }
    return true;
}

bool validateConfig(const AppConfig& cfg, QString* errOut){
    auto fail = [&](const QString& why){ if(errOut) *errOut = why; return false; };
    auto oneSource = [&](const char* name, const QString& f, const QString& s){
        if(f.isEmpty() == s.isEmpty())
            return fail(QString("exactly one of %1_file / %1_string is required").arg(name));
        return true;
    };
    if(!oneSource("users", cfg.usersFile, cfg.usersString)) return false;
    if(!oneSource("passwords", cfg.passwordsFile, cfg.passwordsString)) return false;
    if(!oneSource("ips", cfg.ipsFile, cfg.ipsString)) return false;
    if(cfg.maxConcurrent < 1) return fail("max_concurrent must be at least 1");
    if(cfg.connectTimeoutMs < 1 || cfg.ioTimeoutMs < 1) return fail("timeouts must be at least 1 ms");
    return true;
}

// ========================= 명령행 =========================
CommandLine::CommandLine()
    : helpOpt_(QStringList{"h", "help"}, "Show this help.")
    , versionOpt_(QStringList{"v", "version"}, "Show version.")
    , configOpt_("config", "INI configuration file (default ./config.ini).", "file")
    , usersFileOpt_("users-file", "File with one username per line.", "file")
    , usersStringOpt_("users-string", "A single username.", "name")
    , passwordsFileOpt_("passwords-file", "File with one password per line.", "file")
    , passwordsStringOpt_("passwords-string", "A single password.", "password")
    , ipsFileOpt_("ips-file", "File with one target pattern per line.", "file")
    , ipsStringOpt_("ips-string", "A single target pattern, e.g. 192.168.1.{1-254}:554.", "pattern")
    , maxConcurrentOpt_(QStringList{"m", "max-concurrent"}, "Probes in flight at once (default 5).", "n")
    , pathOpt_("path", "Request path appended to rtsp://host:port.", "path")
    , connectTimeoutOpt_("connect-timeout", "Connect timeout in milliseconds (default 5000).", "ms")
    , ioTimeoutOpt_("io-timeout", "Per-request read/write timeout in milliseconds (default 10000).", "ms")
    , stopOnSuccessOpt_("stop-on-success", "Stop probing a target after its first valid credential.")
    , reportOpt_("report", "Write an XML report to this file.", "file")
    , verifyStreamOpt_("verify-stream", "Read one video frame from every found URL.")
    , logLevelOpt_("log-level", "trace, debug, info, warn or error (default info).", "level")
    , logFileOpt_("log-file", "Also append log messages to this file.", "file")
{
    parser_.setApplicationDescription("RTSP credential audit: tries username/password pairs against RTSP DESCRIBE.");
    parser_.addOptions({ helpOpt_, versionOpt_, configOpt_,
                         usersFileOpt_, usersStringOpt_, passwordsFileOpt_, passwordsStringOpt_,
                         ipsFileOpt_, ipsStringOpt_, maxConcurrentOpt_, pathOpt_,
                         connectTimeoutOpt_, ioTimeoutOpt_, stopOnSuccessOpt_,
                         reportOpt_, verifyStreamOpt_, logLevelOpt_, logFileOpt_ });
}

bool CommandLine::parse(const QStringList& arguments, QString* errOut){
    if(!parser_.parse(arguments)){
        if(errOut) *errOut = parser_.errorText();
        return false;
    }
    if(!parser_.positionalArguments().isEmpty()){
        if(errOut) *errOut = QString("unexpected argument: %1").arg(parser_.positionalArguments().first());
        return false;
    }
    return true;
}

bool CommandLine::applyTo(AppConfig* cfg, QString* errOut) const {
    auto list = [&](const char* name, const QCommandLineOption& fo, const QCommandLineOption& so,
                    QString* f, QString* s){
        return applyListLayer(name, parser_.isSet(fo), parser_.value(fo),
                              parser_.isSet(so), parser_.value(so), f, s, errOut);
    };
    if(!list("users", usersFileOpt_, usersStringOpt_, &cfg->usersFile, &cfg->usersString)) return false;
    if(!list("passwords", passwordsFileOpt_, passwordsStringOpt_, &cfg->passwordsFile, &cfg->passwordsString)) return false;
    if(!list("ips", ipsFileOpt_, ipsStringOpt_, &cfg->ipsFile, &cfg->ipsString)) return false;

    auto number = [&](const QCommandLineOption& o, int* out){
        return !parser_.isSet(o) || toPositiveInt("--" + o.names().last(), parser_.value(o), out, errOut);
    };
    if(!number(maxConcurrentOpt_, &cfg->maxConcurrent)) return false;
    if(!number(connectTimeoutOpt_, &cfg->connectTimeoutMs)) return false;
    if(!number(ioTimeoutOpt_, &cfg->ioTimeoutMs)) return false;

    if(parser_.isSet(pathOpt_)) cfg->path = parser_.value(pathOpt_);
    if(parser_.isSet(stopOnSuccessOpt_)) cfg->stopOnSuccess = true;
    if(parser_.isSet(reportOpt_)) cfg->reportFile = parser_.value(reportOpt_);
    if(parser_.isSet(verifyStreamOpt_)) cfg->verifyStream = true;
    if(parser_.isSet(logFileOpt_)) cfg->logFile = parser_.value(logFileOpt_);
    if(parser_.isSet(logLevelOpt_) && !parseLogLevel(parser_.value(logLevelOpt_), &cfg->logLevel)){
        if(errOut) *errOut = QString("--log-level: unknown level '%1'").arg(parser_.value(logLevelOpt_));
        return false;
    }
    return true;
}

bool resolveConfig(const CommandLine& cmd, AppConfig* out, QString* errOut){
    AppConfig cfg;
    const QString explicitPath = cmd.configPath();
    const QString path = explicitPath.isEmpty() ? QString(DEFAULT_CONFIG_FILE) : explicitPath;
    if(!loadConfigFile(path, &cfg, !explicitPath.isEmpty(), errOut)) return false;
    if(!cmd.applyTo(&cfg, errOut)) return false;
    if(!validateConfig(cfg, errOut)) return false;
    *out = cfg;
    return true;
}
