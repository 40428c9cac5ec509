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
#include "calc/calculator/external_calculator.h"

#include "calc/calculator/calculator_error.h"

#include "score/mw/log/logging.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

namespace calc
{

namespace
{

bool IsServiceIdentifierValid(const std::string_view identifier) noexcept
{
    if (identifier.empty())
    {
        return false;
    }
    return std::all_of(identifier.begin(), identifier.end(), [](const char current_char) {
        const auto u_ch = static_cast<unsigned char>(current_char);
        return (std::isgraph(u_ch) != 0);
    });
}

void LogCallOutsideProduction(const std::string_view operation,
                              const std::int32_t x,
                              const std::int32_t y,
                              const std::string& service_identifier) noexcept
{
    score::mw::log::LogFatal("calc") << "Can't call this in unit tests!" << std::string{operation} << "(" << x << ","
                                     << y << ") was requested from external calculator service"
                                     << service_identifier << ". Terminating.";
}

}  // namespace

score::Result<std::unique_ptr<ExternalCalculator>> ExternalCalculator::Create(
    const CalculatorServiceConfig& config) noexcept
{
    if (!IsServiceIdentifierValid(config.identifier))
    {
        score::mw::log::LogWarn("calc") << "Service identifier" << config.identifier
                                        << "does not adhere to service naming requirements.";
        return score::MakeUnexpected(CalculatorErrc::kInvalidServiceIdentifier);
    }
    return std::unique_ptr<ExternalCalculator>{new ExternalCalculator{config.identifier}};
}

ExternalCalculator::ExternalCalculator(std::string service_identifier) noexcept
    : service_identifier_{std::move(service_identifier)}
{
}

std::string_view ExternalCalculator::GetServiceIdentifier() const noexcept
{
    return service_identifier_;
}

// The service is never contacted: any call reaching this class from a test process is a wiring bug.
std::int32_t ExternalCalculator::Add(const std::int32_t x, const std::int32_t y) const noexcept
{
    LogCallOutsideProduction("Add", x, y, service_identifier_);
    std::terminate();
}

std::int32_t ExternalCalculator::Subtract(const std::int32_t x, const std::int32_t y) const noexcept
{
    LogCallOutsideProduction("Subtract", x, y, service_identifier_);
    std::terminate();
}

std::int32_t ExternalCalculator::Multiply(const std::int32_t x, const std::int32_t y) const noexcept
{
    LogCallOutsideProduction("Multiply", x, y, service_identifier_);
    std::terminate();
}

std::int32_t ExternalCalculator::Divide(const std::int32_t x, const std::int32_t y) const noexcept
{
    LogCallOutsideProduction("Divide", x, y, service_identifier_);
    std::terminate();
}

}  // namespace calc
