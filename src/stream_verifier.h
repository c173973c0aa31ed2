#pragma once

#include <QString>

// url 을 FFmpeg 백엔드로 열고 프레임 하나를 읽을 수 있으면 true.
// 기본 전송으로 실패하면 rtsp_transport=tcp 로 한 번 더.
bool verifyStream(const QString& url, int timeoutMs, QString* errOut = nullptr);
