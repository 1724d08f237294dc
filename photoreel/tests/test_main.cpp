/// @file test_main.cpp
/// @brief Custom main() for the photoreel unit tests.
///
/// Creates a QCoreApplication before running GoogleTest. Timers, queued
/// callbacks and QSignalSpy all need one.

#include <QCoreApplication>
#include <gtest/gtest.h>

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);

  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
