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
#ifndef CALC_CALCULATOR_MOCK_CALCULATOR_MOCK_FACADE_H
#define CALC_CALCULATOR_MOCK_CALCULATOR_MOCK_FACADE_H

#include "calc/calculator/i_calculator.h"
#include "calc/calculator/mock/calculator_mock.h"

#include <cstdint>

namespace calc::test
{

/// \brief Facade class which dispatches to a mock object which is owned by the caller
///
/// The class under test takes exclusive ownership of its calculator, so the mock would be destroyed (and its
/// expectations verified) together with the class under test. A test which wants to verify the mock at a point of its
/// own choosing creates the mock itself and hands this facade to the class under test instead.
class CalculatorMockFacade : public ICalculator
{
  public:
    explicit CalculatorMockFacade(CalculatorMock& calculator_mock) : mock_{calculator_mock} {}

    std::int32_t Add(const std::int32_t x, const std::int32_t y) const noexcept override
    {
        return mock_.Add(x, y);
    }

    std::int32_t Subtract(const std::int32_t x, const std::int32_t y) const noexcept override
    {
        return mock_.Subtract(x, y);
    }

    std::int32_t Multiply(const std::int32_t x, const std::int32_t y) const noexcept override
    {
        return mock_.Multiply(x, y);
    }

    std::int32_t Divide(const std::int32_t x, const std::int32_t y) const noexcept override
    {
        return mock_.Divide(x, y);
    }

  private:
    CalculatorMock& mock_;
};

}  // namespace calc::test

#endif  // CALC_CALCULATOR_MOCK_CALCULATOR_MOCK_FACADE_H
