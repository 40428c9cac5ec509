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
#include "calc/application/application.h"

#include <score/assert.hpp>

#include <utility>

namespace calc
{

Application::Application(std::unique_ptr<ICalculator> calculator) noexcept : calculator_{std::move(calculator)}
{
    SCORE_LANGUAGE_FUTURECPP_PRECONDITION_PRD_MESSAGE(calculator_ != nullptr, "Application requires a calculator");
}

std::int32_t Application::CoolAlgorithm(const std::int32_t x) const noexcept
{
    auto output = x;

    output = calculator_->Add(output, 0);
    output = calculator_->Subtract(output, 0);
    output = calculator_->Multiply(output, 1);
    output = calculator_->Divide(output, 1);

    return output;
}

}  // namespace calc
