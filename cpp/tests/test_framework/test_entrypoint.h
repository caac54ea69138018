#pragma once
/**
 * @file test_entrypoint.h
 * @brief Shared main() for every plexus test executable (see test_entrypoint.cpp).
 */
#include "gtest/gtest.h"
