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
#ifndef CALC_APPLICATION_APPLICATION_H
#define CALC_APPLICATION_APPLICATION_H

#include "calc/calculator/i_calculator.h"

#include <cstdint>
#include <memory>

namespace calc
{

/// \brief Application logic which relies on an external calculation service.
/// \details The calculator is injected on construction and owned exclusively by the Application. The real application
///          passes an ExternalCalculator, unit tests pass a CalculatorMock.
class Application
{
  public:
    /// \brief Constructs the Application.
    /// \param calculator implementation of the calculator to be used. Must not be nullptr.
    explicit Application(std::unique_ptr<ICalculator> calculator) noexcept;

    /// \brief An important bit of application logic that makes use of the calculator.
    /// \details Calls Add(x, 0), Subtract(output, 0), Multiply(output, 1) and Divide(output, 1) in this order, each
    ///          time feeding the previous result into the next call. With a correct calculator the result is x.
    std::int32_t CoolAlgorithm(const std::int32_t x) const noexcept;

  private:
    std::unique_ptr<ICalculator> calculator_;
};

}  // namespace calc

#endif  // CALC_APPLICATION_APPLICATION_H
