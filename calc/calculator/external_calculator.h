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
#ifndef CALC_CALCULATOR_EXTERNAL_CALCULATOR_H
#define CALC_CALCULATOR_EXTERNAL_CALCULATOR_H

#include "calc/calculator/calculator_service_config.h"
#include "calc/calculator/i_calculator.h"

#include "score/result/result.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace calc
{

/// \brief Client of the external calculation service.
/// \details This is the implementation used by the real application. It must never be called from within a unit
///          test: every operation logs a fatal message and terminates the process, so that a test which accidentally
///          got the production calculator injected fails loudly instead of reaching out to the service.
class ExternalCalculator final : public ICalculator
{
  public:
    /// \brief Creates a client for the service named in the configuration.
    /// \return the client or kInvalidServiceIdentifier, if the identifier is empty or contains whitespace or control
    ///         characters.
    static score::Result<std::unique_ptr<ExternalCalculator>> Create(const CalculatorServiceConfig& config) noexcept;

    ~ExternalCalculator() override = default;

    std::int32_t Add(const std::int32_t x, const std::int32_t y) const noexcept override;
    std::int32_t Subtract(const std::int32_t x, const std::int32_t y) const noexcept override;
    std::int32_t Multiply(const std::int32_t x, const std::int32_t y) const noexcept override;
    std::int32_t Divide(const std::int32_t x, const std::int32_t y) const noexcept override;

    std::string_view GetServiceIdentifier() const noexcept;

  private:
    explicit ExternalCalculator(std::string service_identifier) noexcept;

    std::string service_identifier_;
};

}  // namespace calc

#endif  // CALC_CALCULATOR_EXTERNAL_CALCULATOR_H
