/*!
 * @file
 * @brief Translation unit to build Catch2 main.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
