#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lcPattern)
Q_DECLARE_LOGGING_CATEGORY(lcProbe)
Q_DECLARE_LOGGING_CATEGORY(lcWire)
Q_DECLARE_LOGGING_CATEGORY(lcBrute)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

enum class LogLevel { Trace, Debug, Info, Warn, Error };

bool parseLogLevel(const QString& text, LogLevel* out);

// QLoggingCategory::setFilterRules() 에 그대로 넘길 규칙 문자열
QString filterRulesFor(LogLevel level);

// 메시지 패턴 + 카테고리 필터 설치, logFile 이 있으면 파일에도 복사
bool setupLogging(LogLevel level, const QString& logFile = QString(), QString* errOut = nullptr);
