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
#include "calc/calculator/mock/calculator_mock.h"

#include <gtest/gtest.h>

#include <sstream>
#include <utility>

namespace calc
{

namespace
{

std::size_t ToIndex(const CalculatorOperation operation) noexcept
{
    return static_cast<std::size_t>(operation);
}

}  // namespace

std::string_view ToString(const CalculatorOperation operation) noexcept
{
    switch (operation)
    {
        case CalculatorOperation::kAdd:
            return "Add";
        case CalculatorOperation::kSubtract:
            return "Subtract";
        case CalculatorOperation::kMultiply:
            return "Multiply";
        case CalculatorOperation::kDivide:
            return "Divide";
        default:
            return "Unknown";
    }
}

CalculatorExpectation::CalculatorExpectation(const CalculatorOperation operation,
                                             ::testing::Matcher<std::int32_t> x_matcher,
                                             ::testing::Matcher<std::int32_t> y_matcher) noexcept
    : operation_{operation}, x_matcher_{std::move(x_matcher)}, y_matcher_{std::move(y_matcher)}
{
}

CalculatorExpectation& CalculatorExpectation::Times(const std::size_t expected_call_count) noexcept
{
    expected_call_count_ = expected_call_count;
    return *this;
}

CalculatorExpectation& CalculatorExpectation::WillReturn(const std::int32_t return_value) noexcept
{
    return_value_ = return_value;
    return *this;
}

bool CalculatorExpectation::Accepts(const std::int32_t x, const std::int32_t y) const noexcept
{
    return (actual_call_count_ < expected_call_count_) && x_matcher_.Matches(x) && y_matcher_.Matches(y);
}

std::int32_t CalculatorExpectation::Consume() noexcept
{
    ++actual_call_count_;
    return return_value_;
}

bool CalculatorExpectation::IsSatisfied() const noexcept
{
    return actual_call_count_ == expected_call_count_;
}

void CalculatorExpectation::DescribeTo(std::ostream& out) const
{
    out << ToString(operation_) << "(x ";
    x_matcher_.DescribeTo(&out);
    out << ", y ";
    y_matcher_.DescribeTo(&out);
    out << ") returning " << return_value_ << ", expected to be called " << expected_call_count_
        << " time(s), actually called " << actual_call_count_ << " time(s)";
}

CalculatorMock::~CalculatorMock()
{
    VerifyAndClearExpectations();
}

CalculatorExpectation& CalculatorMock::ExpectCall(const CalculatorOperation operation,
                                                  ::testing::Matcher<std::int32_t> x_matcher,
                                                  ::testing::Matcher<std::int32_t> y_matcher)
{
    // std::list keeps references to earlier expectations valid while further ones are registered
    return expectations_.at(ToIndex(operation)).emplace_back(operation, std::move(x_matcher), std::move(y_matcher));
}

CalculatorExpectation& CalculatorMock::ExpectAdd(::testing::Matcher<std::int32_t> x_matcher,
                                                 ::testing::Matcher<std::int32_t> y_matcher)
{
    return ExpectCall(CalculatorOperation::kAdd, std::move(x_matcher), std::move(y_matcher));
}

CalculatorExpectation& CalculatorMock::ExpectSubtract(::testing::Matcher<std::int32_t> x_matcher,
                                                      ::testing::Matcher<std::int32_t> y_matcher)
{
    return ExpectCall(CalculatorOperation::kSubtract, std::move(x_matcher), std::move(y_matcher));
}

CalculatorExpectation& CalculatorMock::ExpectMultiply(::testing::Matcher<std::int32_t> x_matcher,
                                                      ::testing::Matcher<std::int32_t> y_matcher)
{
    return ExpectCall(CalculatorOperation::kMultiply, std::move(x_matcher), std::move(y_matcher));
}

CalculatorExpectation& CalculatorMock::ExpectDivide(::testing::Matcher<std::int32_t> x_matcher,
                                                    ::testing::Matcher<std::int32_t> y_matcher)
{
    return ExpectCall(CalculatorOperation::kDivide, std::move(x_matcher), std::move(y_matcher));
}

bool CalculatorMock::VerifyAndClearExpectations()
{
    bool all_satisfied{true};
    for (auto& operation_expectations : expectations_)
    {
        for (const auto& expectation : operation_expectations)
        {
            if (!expectation.IsSatisfied())
            {
                std::ostringstream description{};
                expectation.DescribeTo(description);
                ADD_FAILURE() << "Unsatisfied expectation: " << description.str();
                all_satisfied = false;
            }
        }
        operation_expectations.clear();
    }
    return all_satisfied;
}

std::int32_t CalculatorMock::Add(const std::int32_t x, const std::int32_t y) const noexcept
{
    return Invoke(CalculatorOperation::kAdd, x, y);
}

std::int32_t CalculatorMock::Subtract(const std::int32_t x, const std::int32_t y) const noexcept
{
    return Invoke(CalculatorOperation::kSubtract, x, y);
}

std::int32_t CalculatorMock::Multiply(const std::int32_t x, const std::int32_t y) const noexcept
{
    return Invoke(CalculatorOperation::kMultiply, x, y);
}

std::int32_t CalculatorMock::Divide(const std::int32_t x, const std::int32_t y) const noexcept
{
    return Invoke(CalculatorOperation::kDivide, x, y);
}

std::int32_t CalculatorMock::Invoke(const CalculatorOperation operation,
                                    const std::int32_t x,
                                    const std::int32_t y) const noexcept
{
    auto& operation_expectations = expectations_[ToIndex(operation)];
    for (auto& expectation : operation_expectations)
    {
        if (expectation.Accepts(x, y))
        {
            return expectation.Consume();
        }
    }

    std::ostringstream message{};
    message << "Unexpected call: " << ToString(operation) << "(" << ::testing::PrintToString(x) << ", "
            << ::testing::PrintToString(y) << ")\n";
    if (operation_expectations.empty())
    {
        message << "No expectation is registered for " << ToString(operation) << ".";
    }
    else
    {
        message << "No registered expectation with calls left accepts these arguments. Registered expectations:";
        for (const auto& expectation : operation_expectations)
        {
            message << "\n  ";
            expectation.DescribeTo(message);
        }
    }
    ADD_FAILURE() << message.str();
    return 0;
}

}  // namespace calc
