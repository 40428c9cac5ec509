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
#ifndef CALC_CALCULATOR_CALCULATOR_ERROR_H
#define CALC_CALCULATOR_CALCULATOR_ERROR_H

#include "score/result/result.h"

#include <string_view>

namespace calc
{

/// \brief Recoverable errors which can occur while setting up a calculator.
/// \details Calls on a wrongly wired calculator are not covered here: those are programming errors and terminate.
enum class CalculatorErrc : score::result::ErrorCode
{
    kInvalidServiceIdentifier = 1,
    kUnknownBackend,
    kInvalidCommandLine,
};

class CalculatorErrorDomain final : public score::result::ErrorDomain
{
  public:
    std::string_view MessageFor(const score::result::ErrorCode& code) const noexcept override
    {
        switch (code)
        {
            case static_cast<score::result::ErrorCode>(CalculatorErrc::kInvalidServiceIdentifier):
                return "Service identifier is empty or contains invalid characters.";
            case static_cast<score::result::ErrorCode>(CalculatorErrc::kUnknownBackend):
                return "Unknown calculator backend.";
            case static_cast<score::result::ErrorCode>(CalculatorErrc::kInvalidCommandLine):
                return "Command line arguments could not be parsed.";
            default:
                return "unknown calculator error";
        }
    }
};

score::result::Error MakeError(const CalculatorErrc code, const std::string_view message = "");

}  // namespace calc

#endif  // CALC_CALCULATOR_CALCULATOR_ERROR_H
