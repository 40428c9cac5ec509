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
#include "calc/calculator/local_calculator.h"

#include <score/assert.hpp>

#include <limits>

namespace calc
{

namespace
{

constexpr auto kMin = std::numeric_limits<std::int32_t>::min();
constexpr auto kMax = std::numeric_limits<std::int32_t>::max();

bool IsRepresentable(const std::int64_t value) noexcept
{
    return (value >= static_cast<std::int64_t>(kMin)) && (value <= static_cast<std::int64_t>(kMax));
}

}  // namespace

std::int32_t LocalCalculator::Add(const std::int32_t x, const std::int32_t y) const noexcept
{
    const auto sum = static_cast<std::int64_t>(x) + static_cast<std::int64_t>(y);
    SCORE_LANGUAGE_FUTURECPP_PRECONDITION_PRD_MESSAGE(IsRepresentable(sum), "Addition overflows std::int32_t");
    return static_cast<std::int32_t>(sum);
}

std::int32_t LocalCalculator::Subtract(const std::int32_t x, const std::int32_t y) const noexcept
{
    const auto difference = static_cast<std::int64_t>(x) - static_cast<std::int64_t>(y);
    SCORE_LANGUAGE_FUTURECPP_PRECONDITION_PRD_MESSAGE(IsRepresentable(difference),
                                                      "Subtraction overflows std::int32_t");
    return static_cast<std::int32_t>(difference);
}

std::int32_t LocalCalculator::Multiply(const std::int32_t x, const std::int32_t y) const noexcept
{
    // The product of two 32-bit values always fits into 64 bits.
    const auto product = static_cast<std::int64_t>(x) * static_cast<std::int64_t>(y);
    SCORE_LANGUAGE_FUTURECPP_PRECONDITION_PRD_MESSAGE(IsRepresentable(product),
                                                      "Multiplication overflows std::int32_t");
    return static_cast<std::int32_t>(product);
}

std::int32_t LocalCalculator::Divide(const std::int32_t x, const std::int32_t y) const noexcept
{
    SCORE_LANGUAGE_FUTURECPP_PRECONDITION_PRD_MESSAGE(y != 0, "Division by zero");
    SCORE_LANGUAGE_FUTURECPP_PRECONDITION_PRD_MESSAGE(!((x == kMin) && (y == -1)), "Division overflows std::int32_t");
    return x / y;
}

}  // namespace calc
