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
#include "calc/application/application_configuration.h"
#include "calc/application/calculator_factory.h"

#include "score/mw/log/logging.h"

#include <cstdint>
#include <iostream>
#include <utility>

namespace calc
{
namespace
{

int Run(const std::int32_t argc, const char** argv)
{
    const auto configuration_result = ApplicationConfiguration::FromCommandLine(argc, argv);
    if (!configuration_result.has_value())
    {
        std::cerr << "Unable to parse command line: " << configuration_result.error().Message() << "\n";
        return -1;
    }
    const auto& configuration = configuration_result.value();

    if (configuration.IsHelpRequested())
    {
        std::cerr << configuration.GetUsage() << std::endl;
        return 0;
    }

    auto calculator_result = CreateCalculator(configuration);
    if (!calculator_result.has_value())
    {
        std::cerr << "Unable to create calculator: " << calculator_result.error().Message() << "\n";
        return -2;
    }

    const Application application{std::move(calculator_result).value()};
    const auto input = configuration.GetInput();
    const auto output = application.CoolAlgorithm(input);

    score::mw::log::LogInfo("calc") << "CoolAlgorithm(" << input << ") returned" << output;
    return 0;
}

}  // namespace
}  // namespace calc

int main(int argc, const char** argv)
{
    return calc::Run(argc, argv);
}
