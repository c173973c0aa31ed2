#pragma once

#include "target_pattern.h"

#include <QString>
#include <QStringList>

// UTF-8 텍스트, 한 줄에 하나. 앞뒤 공백 제거, 빈 줄과 '#' 주석 줄은 건너뜀
bool readLines(const QString& path, QStringList* out, QString* errOut = nullptr);

// inlineValue 가 있으면 그것 하나, 없으면 file 을 읽는다
bool loadList(const QString& file, const QString& inlineValue, QStringList* out, QString* errOut = nullptr);

// 패턴 줄들 → TargetSequence.
// 패턴이 아니지만 호스트 이름처럼 보이면 DNS (첫 IPv4) 로 풀어서 추가한다.
// 쓸 수 있는 줄이 하나도 없으면 false.
bool buildTargetSequence(const QStringList& lines, TargetSequence* out, QString* errOut = nullptr);
