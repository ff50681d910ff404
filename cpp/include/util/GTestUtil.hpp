#pragma once

#include <gtest/gtest.h>

// Dispatches to standard gtest main function, while adding LoggingUtil cmdline params.
//
// Every UnitTests.cpp ends with:
//
// int main(int argc, char** argv) { return launch_gtest(argc, argv); }
int launch_gtest(int argc, char** argv);
