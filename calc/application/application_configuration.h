/********************************************************************************
 * Copyright (c) 2025 Contributors to the Eclipse Foundation
 *
 * See the NOTICE file(s) distributed with this work for additional
 * information regarding copyright ownership.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Apache License Version 2.0 which is available at
 * https://www.apache.org/licenses/LICENSE-2.0
 *
 * SPDX-License-Identifier: Apache-2.0
 ********************************************************************************/
#ifndef CALC_APPLICATION_APPLICATION_CONFIGURATION_H
#define CALC_APPLICATION_APPLICATION_CONFIGURATION_H

#include "score/result/result.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace calc
{

enum class CalculatorBackend : std::uint8_t
{
    kExternal,
    kLocal,
};

/// \brief Parses the textual name of a backend ("external" or "local").
score::Result<CalculatorBackend> ParseCalculatorBackend(const std::string_view name) noexcept;

/// \brief Configuration of the calc application, usually created from the command line.
class ApplicationConfiguration
{
  public:
    /// \brief Default constructor which uses the external backend, the default service identifier and input 0.
    ApplicationConfiguration();

    ApplicationConfiguration(const CalculatorBackend backend, std::string service_identifier, const std::int32_t input);

    /// \brief Creates the configuration from command line arguments.
    /// \details Supported arguments are --backend <external|local>, --service_identifier <id>, --input <int32> and
    ///          --help. Single dash long options are accepted as well. Missing arguments keep their default value.
    /// \return the configuration, kUnknownBackend for an unsupported backend name or kInvalidCommandLine if the
    ///         arguments could not be parsed.
    // NOLINTNEXTLINE(modernize-avoid-c-arrays):C-style array tolerated for command line arguments
    static score::Result<ApplicationConfiguration> FromCommandLine(const std::int32_t argc,
                                                                   const char* const argv[]) noexcept;

    CalculatorBackend GetBackend() const noexcept;
    const std::string& GetServiceIdentifier() const noexcept;
    std::int32_t GetInput() const noexcept;

    /// \brief true if --help was given. GetUsage() then holds the description of all options.
    bool IsHelpRequested() const noexcept;
    const std::string& GetUsage() const noexcept;

  private:
    CalculatorBackend backend_;
    std::string service_identifier_;
    std::int32_t input_;
    bool help_requested_;
    std::string usage_;
};

}  // namespace calc

#endif  // CALC_APPLICATION_APPLICATION_CONFIGURATION_H
