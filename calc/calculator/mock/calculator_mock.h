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
#ifndef CALC_CALCULATOR_MOCK_CALCULATOR_MOCK_H
#define CALC_CALCULATOR_MOCK_CALCULATOR_MOCK_H

#include "calc/calculator/i_calculator.h"

#include "gmock/gmock.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <list>
#include <ostream>
#include <string_view>

namespace calc
{

enum class CalculatorOperation : std::uint8_t
{
    kAdd,
    kSubtract,
    kMultiply,
    kDivide,
};

std::string_view ToString(const CalculatorOperation operation) noexcept;

/// \brief One registered expectation of a CalculatorMock
///
/// Accepts a call to its operation when both argument matchers accept the arguments and fewer calls than the expected
/// call count were consumed so far. Expects exactly one call returning 0 unless configured otherwise.
class CalculatorExpectation
{
  public:
    CalculatorExpectation(const CalculatorOperation operation,
                          ::testing::Matcher<std::int32_t> x_matcher,
                          ::testing::Matcher<std::int32_t> y_matcher) noexcept;

    CalculatorExpectation& Times(const std::size_t expected_call_count) noexcept;
    CalculatorExpectation& WillReturn(const std::int32_t return_value) noexcept;

    bool Accepts(const std::int32_t x, const std::int32_t y) const noexcept;
    std::int32_t Consume() noexcept;

    bool IsSatisfied() const noexcept;
    void DescribeTo(std::ostream& out) const;

  private:
    CalculatorOperation operation_;
    ::testing::Matcher<std::int32_t> x_matcher_;
    ::testing::Matcher<std::int32_t> y_matcher_;
    std::size_t expected_call_count_{1U};
    std::size_t actual_call_count_{0U};
    std::int32_t return_value_{0};
};

/// \brief Test double for ICalculator which consumes expectations in registration order
///
/// Every call is matched against the expectations of the called operation in the order in which they were registered.
/// The first expectation which accepts the arguments and still has calls left is consumed and its return value is
/// returned. Expectations which are used up are skipped, so a later expectation accepting the same arguments takes over.
/// A call which no expectation accepts is an unexpected call: it fails the running test with the operation and its
/// arguments and returns 0.
///
/// Expectations which were not called exactly their expected number of times fail the running test on
/// VerifyAndClearExpectations() and on destruction.
///
/// Argument matchers are gmock matchers, so plain values, ::testing::_ and any other matcher for std::int32_t can be
/// used:
///
///     calculator_mock.ExpectAdd(100, 0).WillReturn(100);
///     calculator_mock.ExpectDivide(_, Ne(0)).Times(2).WillReturn(1);
class CalculatorMock : public ICalculator
{
  public:
    CalculatorMock() = default;
    ~CalculatorMock() override;

    CalculatorExpectation& ExpectCall(const CalculatorOperation operation,
                                      ::testing::Matcher<std::int32_t> x_matcher,
                                      ::testing::Matcher<std::int32_t> y_matcher);

    CalculatorExpectation& ExpectAdd(::testing::Matcher<std::int32_t> x_matcher,
                                     ::testing::Matcher<std::int32_t> y_matcher);
    CalculatorExpectation& ExpectSubtract(::testing::Matcher<std::int32_t> x_matcher,
                                          ::testing::Matcher<std::int32_t> y_matcher);
    CalculatorExpectation& ExpectMultiply(::testing::Matcher<std::int32_t> x_matcher,
                                          ::testing::Matcher<std::int32_t> y_matcher);
    CalculatorExpectation& ExpectDivide(::testing::Matcher<std::int32_t> x_matcher,
                                        ::testing::Matcher<std::int32_t> y_matcher);

    /// \brief Reports every expectation which was not called its expected number of times and removes all expectations.
    /// \return true if all expectations were satisfied.
    bool VerifyAndClearExpectations();

    std::int32_t Add(const std::int32_t x, const std::int32_t y) const noexcept override;
    std::int32_t Subtract(const std::int32_t x, const std::int32_t y) const noexcept override;
    std::int32_t Multiply(const std::int32_t x, const std::int32_t y) const noexcept override;
    std::int32_t Divide(const std::int32_t x, const std::int32_t y) const noexcept override;

  private:
    static constexpr std::size_t kOperationCount{4U};

    std::int32_t Invoke(const CalculatorOperation operation, const std::int32_t x, const std::int32_t y) const noexcept;

    // Call counts are updated from the const ICalculator operations.
    mutable std::array<std::list<CalculatorExpectation>, kOperationCount> expectations_{};
};

}  // namespace calc

#endif  // CALC_CALCULATOR_MOCK_CALCULATOR_MOCK_H
