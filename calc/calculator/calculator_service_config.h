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
#ifndef CALC_CALCULATOR_CALCULATOR_SERVICE_CONFIG_H
#define CALC_CALCULATOR_CALCULATOR_SERVICE_CONFIG_H

#include <string>

namespace calc
{

/// \brief Configuration of the client side of the external calculation service
struct CalculatorServiceConfig
{
    std::string identifier;  ///< The service name in the service namespace
};

}  // namespace calc

#endif  // CALC_CALCULATOR_CALCULATOR_SERVICE_CONFIG_H
