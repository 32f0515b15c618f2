#pragma once

/**
 * @file format.hpp
 * @brief Single place where the {fmt} library is pulled into the project.
 */

#include <fmt/format.h>
#include <fmt/ranges.h>
