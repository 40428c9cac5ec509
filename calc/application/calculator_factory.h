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
#ifndef CALC_APPLICATION_CALCULATOR_FACTORY_H
#define CALC_APPLICATION_CALCULATOR_FACTORY_H

#include "calc/application/application_configuration.h"
#include "calc/calculator/i_calculator.h"

#include "score/result/result.h"

#include <memory>

namespace calc
{

/// \brief Creates the calculator implementation selected by the configuration.
/// \return the calculator or the error of the selected implementation's creation.
score::Result<std::unique_ptr<ICalculator>> CreateCalculator(const ApplicationConfiguration& configuration) noexcept;

}  // namespace calc

#endif  // CALC_APPLICATION_CALCULATOR_FACTORY_H
