// hyperray - 4D Monte Carlo path tracer
// Copyright (c) 2025 hyperray Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace hyperray
{

/**
 * @brief Base exception class for hyperray errors
 */
class HyperrayError : public std::runtime_error
{
public:
    explicit HyperrayError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Scene construction/validation errors
 */
class SceneError : public HyperrayError
{
public:
    explicit SceneError(const std::string& message) : HyperrayError("Scene error: " + message) {}
};

/**
 * @brief Configuration errors
 */
class ConfigError : public HyperrayError
{
public:
    explicit ConfigError(const std::string& message) : HyperrayError("Config error: " + message) {}
};

/**
 * @brief Output image errors
 */
class ImageError : public HyperrayError
{
public:
    explicit ImageError(const std::string& message) : HyperrayError("Image error: " + message) {}
};

} // namespace hyperray
