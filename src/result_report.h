#pragma once

#include "brute_forcer.h"

#include <QByteArray>
#include <QString>

#include <vector>

enum class StreamCheck { NotChecked, Ok, Failed };

struct ReportEntry {
    FoundCredential found;
    StreamCheck stream = StreamCheck::NotChecked;
};

// <rtspaudit><summary .../><credential .../>...</rtspaudit>
// 항목은 대상, username, password 순으로 정렬된다
QByteArray renderXmlReport(const RunTally& tally, std::vector<ReportEntry> entries, const QString& path = QString());

bool writeXmlReport(const QString& file, const RunTally& tally, std::vector<ReportEntry> entries,
                    const QString& path = QString(), QString* errOut = nullptr);
