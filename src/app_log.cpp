#include "app_log.h"

#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>

Q_LOGGING_CATEGORY(lcPattern, "rtspaudit.pattern")
Q_LOGGING_CATEGORY(lcProbe,   "rtspaudit.probe")
Q_LOGGING_CATEGORY(lcWire,    "rtspaudit.wire")
Q_LOGGING_CATEGORY(lcBrute,   "rtspaudit.brute")
Q_LOGGING_CATEGORY(lcApp,     "rtspaudit.app")

static const char* MESSAGE_PATTERN =
    "[%{time yyyy-MM-dd hh:mm:ss.zzz}] "
    "[%{if-debug}DEBUG%{endif}%{if-info}INFO %{endif}%{if-warning}WARN %{endif}"
    "%{if-critical}ERROR%{endif}%{if-fatal}FATAL%{endif}] "
    "[%{category}] %{message}";

// ========================= 파일 미러 =========================
static QMutex g_fileMutex;
static QFile* g_logFile = nullptr;
static QtMessageHandler g_previousHandler = nullptr;

static void mirrorHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg){
    if(g_previousHandler) g_previousHandler(type, ctx, msg);
    QMutexLocker lock(&g_fileMutex);
    if(!g_logFile) return;
    QTextStream out(g_logFile);
    out << qFormatLogMessage(type, ctx, msg) << '\n';
    out.flush();
}

bool parseLogLevel(const QString& text, LogLevel* out){
    const QString t = text.trimmed().toLower();
    if(t == "trace")                          *out = LogLevel::Trace;
    else if(t == "debug")                     *out = LogLevel::Debug;
    else if(t == "info")                      *out = LogLevel::Info;
    else if(t == "warn" || t == "warning")    *out = LogLevel::Warn;
    else if(t == "error")                     *out = LogLevel::Error;
    else return false;
    return true;
}

QString filterRulesFor(LogLevel level){
    QStringList rules;
    switch(level){
    case LogLevel::Trace:
        rules << "rtspaudit.*=true";
        break;
    case LogLevel::Debug:
        rules << "rtspaudit.*=true" << "rtspaudit.wire.debug=false";
        break;
    case LogLevel::Info:
        rules << "rtspaudit.*=true" << "rtspaudit.*.debug=false";
        break;
    case LogLevel::Warn:
        rules << "rtspaudit.*=true" << "rtspaudit.*.debug=false" << "rtspaudit.*.info=false";
        break;
    case LogLevel::Error:
        rules << "rtspaudit.*=true" << "rtspaudit.*.debug=false" << "rtspaudit.*.info=false"
              << "rtspaudit.*.warning=false";
        break;
    }
    return rules.join('\n');
}

bool setupLogging(LogLevel level, const QString& logFile, QString* errOut){
    qSetMessagePattern(MESSAGE_PATTERN);
    QLoggingCategory::setFilterRules(filterRulesFor(level));

    if(logFile.isEmpty()) return true;

    auto file = new QFile(logFile);
    if(!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)){
        if(errOut) *errOut = QString("cannot open log file %1: %2").arg(logFile, file->errorString());
        delete file;
        return false;
    }
    {
        QMutexLocker lock(&g_fileMutex);
        delete g_logFile;
        g_logFile = file;
    }
    if(!g_previousHandler) g_previousHandler = qInstallMessageHandler(mirrorHandler);
    return true;
}
