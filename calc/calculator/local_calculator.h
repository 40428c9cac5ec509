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
#ifndef CALC_CALCULATOR_LOCAL_CALCULATOR_H
#define CALC_CALCULATOR_LOCAL_CALCULATOR_H

#include "calc/calculator/i_calculator.h"

#include <cstdint>

namespace calc
{

/// \brief In-process calculator computing true 32-bit integer arithmetic.
/// \details Results which are not representable as std::int32_t (overflow, division by zero) are contract violations.
class LocalCalculator final : public ICalculator
{
  public:
    LocalCalculator() noexcept = default;
    ~LocalCalculator() override = default;

    std::int32_t Add(const std::int32_t x, const std::int32_t y) const noexcept override;
    std::int32_t Subtract(const std::int32_t x, const std::int32_t y) const noexcept override;
    std::int32_t Multiply(const std::int32_t x, const std::int32_t y) const noexcept override;
    std::int32_t Divide(const std::int32_t x, const std::int32_t y) const noexcept override;
};

}  // namespace calc

#endif  // CALC_CALCULATOR_LOCAL_CALCULATOR_H
