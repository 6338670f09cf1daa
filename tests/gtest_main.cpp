#include <gtest/gtest.h>

#include <QCoreApplication>

#include "Logger.h"

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("PassdeckTests");
    QCoreApplication::setApplicationName("PassdeckTests");

    ::testing::InitGoogleTest(&argc, argv);
    Logger::init(std::string(), spdlog::level::err);

    return RUN_ALL_TESTS();
}
