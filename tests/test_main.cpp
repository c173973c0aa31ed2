#include "app_log.h"

#include <QCoreApplication>

#include <gtest/gtest.h>

int main(int argc, char** argv){
    ::testing::InitGoogleTest(&argc, argv);
    // QTcpSocket / QHostInfo 에 필요
    QCoreApplication app(argc, argv);
    setupLogging(qEnvironmentVariableIsSet("RTSPAUDIT_TEST_DEBUG") ? LogLevel::Trace : LogLevel::Error);
    return RUN_ALL_TESTS();
}
