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
#ifndef CALC_CALCULATOR_I_CALCULATOR_H
#define CALC_CALCULATOR_I_CALCULATOR_H

#include <cstdint>

namespace calc
{

/// \brief Interface of a 32-bit integer calculator, as implemented by a client of an external calculation service.
/// \details The interface itself does not restrict the operand range. Whether e.g. a division by zero is rejected,
///          reported or forwarded to the service is up to the implementation.
///          Users of the interface shall receive the implementation from the outside (typically as a constructor
///          argument), so that a test can substitute it by CalculatorMock.
class ICalculator
{
  public:
    virtual ~ICalculator() = default;

    /// \brief Returns the sum of x and y.
    virtual std::int32_t Add(const std::int32_t x, const std::int32_t y) const noexcept = 0;

    /// \brief Returns the difference of x and y.
    virtual std::int32_t Subtract(const std::int32_t x, const std::int32_t y) const noexcept = 0;

    /// \brief Returns the product of x and y.
    virtual std::int32_t Multiply(const std::int32_t x, const std::int32_t y) const noexcept = 0;

    /// \brief Returns the quotient of x and y.
    virtual std::int32_t Divide(const std::int32_t x, const std::int32_t y) const noexcept = 0;

  protected:
    ICalculator() noexcept = default;
    ICalculator(const ICalculator&) = delete;
    ICalculator(ICalculator&&) = delete;
    ICalculator& operator=(const ICalculator&) = delete;
    ICalculator& operator=(ICalculator&&) = delete;
};

}  // namespace calc

#endif  // CALC_CALCULATOR_I_CALCULATOR_H
