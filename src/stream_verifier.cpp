#include "stream_verifier.h"
#include "app_log.h"

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include <vector>

static bool openRtsp(cv::VideoCapture& cap, const std::string& uri, int timeoutMs){
    const std::vector<int> params{ cv::CAP_PROP_OPEN_TIMEOUT_MSEC, timeoutMs,
                                   cv::CAP_PROP_READ_TIMEOUT_MSEC, timeoutMs };
    // 1) 기본(보통 UDP)
    if(cap.open(uri, cv::CAP_FFMPEG, params)) return true;
    // 2) TCP 강제 재시도
    std::string u2 = uri;
    if(uri.find('?') == std::string::npos) u2 += "?rtsp_transport=tcp";
    else                                   u2 += "&rtsp_transport=tcp";
    cap.release();
    qCDebug(lcApp) << "retrying over TCP";
    return cap.open(u2, cv::CAP_FFMPEG, params);
}

bool verifyStream(const QString& url, int timeoutMs, QString* errOut){
    cv::VideoCapture cap;
    try {
        if(!openRtsp(cap, url.toStdString(), timeoutMs)){
            if(errOut) *errOut = "cannot open stream";
            return false;
        }
        cv::Mat frame;
        const bool ok = cap.read(frame) && !frame.empty();
        cap.release();
        if(!ok){
            if(errOut) *errOut = "no frame received";
            return false;
        }
        qCDebug(lcApp) << "frame" << frame.cols << "x" << frame.rows;
        return true;
    } catch(const cv::Exception& e){
        if(errOut) *errOut = QString::fromStdString(e.what());
        return false;
    }
}
