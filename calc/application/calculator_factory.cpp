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
#include "calc/application/calculator_factory.h"

#include "calc/calculator/calculator_error.h"
#include "calc/calculator/calculator_service_config.h"
#include "calc/calculator/external_calculator.h"
#include "calc/calculator/local_calculator.h"

#include <utility>

namespace calc
{

score::Result<std::unique_ptr<ICalculator>> CreateCalculator(const ApplicationConfiguration& configuration) noexcept
{
    switch (configuration.GetBackend())
    {
        case CalculatorBackend::kLocal:
            return std::unique_ptr<ICalculator>{std::make_unique<LocalCalculator>()};
        case CalculatorBackend::kExternal:
        {
            auto calculator_result =
                ExternalCalculator::Create(CalculatorServiceConfig{configuration.GetServiceIdentifier()});
            if (!calculator_result.has_value())
            {
                return score::MakeUnexpected<std::unique_ptr<ICalculator>>(calculator_result.error());
            }
            return std::unique_ptr<ICalculator>{std::move(calculator_result).value()};
        }
        default:
            return score::MakeUnexpected(CalculatorErrc::kUnknownBackend);
    }
}

}  // namespace calc
