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
#include "calc/calculator/mock/calculator_mock_facade.h"

#include <gmock/gmock.h>
#include <gtest/gtest-spi.h>
#include <gtest/gtest.h>

#include <cstdint>

namespace calc
{
namespace
{

using ::testing::_;
using ::testing::Ne;

constexpr std::int32_t kNumber{100};

class CalculatorMockFixture : public ::testing::Test
{
  protected:
    CalculatorMock calculator_mock_{};
};

TEST_F(CalculatorMockFixture, EachExpectationIsConsumedOnceAndReturnsConfiguredValue)
{
    // Given one expectation per operation with exact argument matchers
    calculator_mock_.ExpectAdd(kNumber, 0).Times(1).WillReturn(kNumber);
    calculator_mock_.ExpectSubtract(kNumber, 0).Times(1).WillReturn(kNumber);
    calculator_mock_.ExpectMultiply(kNumber, 1).Times(1).WillReturn(kNumber);
    calculator_mock_.ExpectDivide(kNumber, 1).Times(1).WillReturn(kNumber);

    // When calling every operation with the expected arguments
    // Then the configured values are returned
    EXPECT_EQ(calculator_mock_.Add(kNumber, 0), kNumber);
    EXPECT_EQ(calculator_mock_.Subtract(kNumber, 0), kNumber);
    EXPECT_EQ(calculator_mock_.Multiply(kNumber, 1), kNumber);
    EXPECT_EQ(calculator_mock_.Divide(kNumber, 1), kNumber);

    // and every expectation is satisfied
    EXPECT_TRUE(calculator_mock_.VerifyAndClearExpectations());
}

TEST_F(CalculatorMockFixture, ReturnedValueDoesNotNeedToBeArithmeticallyCorrect)
{
    calculator_mock_.ExpectAdd(2, 2).WillReturn(5);

    EXPECT_EQ(calculator_mock_.Add(2, 2), 5);
}

TEST_F(CalculatorMockFixture, ExpectationWithoutConfiguredValueReturnsZero)
{
    calculator_mock_.ExpectMultiply(6, 7);

    EXPECT_EQ(calculator_mock_.Multiply(6, 7), 0);
}

TEST_F(CalculatorMockFixture, WildcardMatcherAcceptsAnyArgument)
{
    // Given an expectation which only constrains the second argument
    calculator_mock_.ExpectMultiply(_, 1).Times(3).WillReturn(9);

    // Then it accepts any first argument
    EXPECT_EQ(calculator_mock_.Multiply(-7, 1), 9);
    EXPECT_EQ(calculator_mock_.Multiply(0, 1), 9);
    EXPECT_EQ(calculator_mock_.Multiply(42, 1), 9);
}

TEST_F(CalculatorMockFixture, AnyGmockMatcherCanBeUsed)
{
    // Given an expectation which accepts every divisor except 0
    calculator_mock_.ExpectDivide(_, Ne(0)).WillReturn(1);

    // Then a division by 0 is not accepted
    EXPECT_NONFATAL_FAILURE(calculator_mock_.Divide(5, 0), "Unexpected call: Divide(5, 0)");

    // but any other divisor is
    EXPECT_EQ(calculator_mock_.Divide(5, 2), 1);
}

TEST_F(CalculatorMockFixture, CallWithUnexpectedArgumentsFailsNamingMethodAndArguments)
{
    // Given an expectation for Add(100, 0)
    calculator_mock_.ExpectAdd(kNumber, 0).WillReturn(kNumber);

    // When calling Add with different arguments
    // Then the call is reported as failure naming the method and the actual arguments
    EXPECT_NONFATAL_FAILURE(calculator_mock_.Add(1, 0), "Unexpected call: Add(1, 0)");

    // and the expectation is still pending
    EXPECT_EQ(calculator_mock_.Add(kNumber, 0), kNumber);
}

TEST_F(CalculatorMockFixture, CallOfMethodWithoutExpectationFails)
{
    // Given no expectation at all for Multiply
    // When calling Multiply
    // Then the call is reported as failure
    EXPECT_NONFATAL_FAILURE(calculator_mock_.Multiply(2, 3), "No expectation is registered for Multiply");
}

TEST_F(CalculatorMockFixture, CallBeyondConfiguredCountFails)
{
    // Given an expectation for exactly one call
    calculator_mock_.ExpectSubtract(kNumber, 0).Times(1).WillReturn(kNumber);

    // When calling it once
    EXPECT_EQ(calculator_mock_.Subtract(kNumber, 0), kNumber);

    // Then a second call is reported as failure listing the used up expectation
    std::int32_t result{-1};
    EXPECT_NONFATAL_FAILURE(result = calculator_mock_.Subtract(kNumber, 0),
                            "expected to be called 1 time(s), actually called 1 time(s)");

    // and returns 0
    EXPECT_EQ(result, 0);
}

TEST_F(CalculatorMockFixture, UnconsumedExpectationFailsVerification)
{
    // Given an expectation which is never invoked
    calculator_mock_.ExpectDivide(10, 2).WillReturn(5);

    // When verifying the mock
    // Then verification fails naming the unmet expectation
    EXPECT_NONFATAL_FAILURE(calculator_mock_.VerifyAndClearExpectations(),
                            "Unsatisfied expectation: Divide(x is equal to 10, y is equal to 2)");
}

TEST_F(CalculatorMockFixture, PartiallyConsumedExpectationFailsVerification)
{
    calculator_mock_.ExpectAdd(_, _).Times(2);

    calculator_mock_.Add(1, 1);

    EXPECT_NONFATAL_FAILURE(calculator_mock_.VerifyAndClearExpectations(),
                            "expected to be called 2 time(s), actually called 1 time(s)");
}

TEST_F(CalculatorMockFixture, VerificationRemovesAllExpectations)
{
    // Given a satisfied expectation which still accepts further calls before verification
    calculator_mock_.ExpectAdd(_, _).Times(1);
    calculator_mock_.Add(0, 0);

    // When verifying the mock
    EXPECT_TRUE(calculator_mock_.VerifyAndClearExpectations());

    // Then further calls are unexpected
    EXPECT_NONFATAL_FAILURE(calculator_mock_.Add(0, 0), "No expectation is registered for Add");
}

TEST(CalculatorMockTest, DestructionReportsUnsatisfiedExpectation)
{
    // Given a mock with an expectation which is never invoked
    // When the mock is destroyed
    // Then the unmet expectation is reported
    EXPECT_NONFATAL_FAILURE(
        {
            CalculatorMock calculator_mock{};
            calculator_mock.ExpectSubtract(3, 1).WillReturn(2);
        },
        "Unsatisfied expectation: Subtract(x is equal to 3, y is equal to 1)");
}

TEST_F(CalculatorMockFixture, OnlyMatchingExpectationIsConsumedAndOtherStaysPending)
{
    // Given two expectations for the same method with different argument matchers
    calculator_mock_.ExpectAdd(1, _).WillReturn(10);
    calculator_mock_.ExpectAdd(2, _).WillReturn(20);

    // When calling with arguments matching only the second expectation
    // Then the second expectation's value is returned
    EXPECT_EQ(calculator_mock_.Add(2, 5), 20);

    // and the first expectation is still pending
    EXPECT_NONFATAL_FAILURE(calculator_mock_.VerifyAndClearExpectations(),
                            "Unsatisfied expectation: Add(x is equal to 1, y is anything)");
}

TEST_F(CalculatorMockFixture, ExpectationsWithDifferentMatchersCanBeConsumedInAnyOrder)
{
    calculator_mock_.ExpectAdd(1, _).WillReturn(10);
    calculator_mock_.ExpectAdd(2, _).WillReturn(20);

    EXPECT_EQ(calculator_mock_.Add(2, 0), 20);
    EXPECT_EQ(calculator_mock_.Add(1, 0), 10);
    EXPECT_TRUE(calculator_mock_.VerifyAndClearExpectations());
}

TEST_F(CalculatorMockFixture, FirstMatchingExpectationInRegistrationOrderIsConsumed)
{
    // Given two expectations accepting the same arguments
    calculator_mock_.ExpectAdd(_, _).WillReturn(1);
    calculator_mock_.ExpectAdd(_, _).WillReturn(2);

    // When calling with arguments accepted by both
    // Then the expectation registered first is consumed first
    EXPECT_EQ(calculator_mock_.Add(0, 0), 1);

    // and the second one afterwards
    EXPECT_EQ(calculator_mock_.Add(0, 0), 2);
    EXPECT_TRUE(calculator_mock_.VerifyAndClearExpectations());
}

TEST_F(CalculatorMockFixture, UsedUpExpectationIsSkippedInFavourOfNextMatchingOne)
{
    // Given a catch-all expectation registered before a more specific one
    calculator_mock_.ExpectAdd(_, _).WillReturn(1);
    calculator_mock_.ExpectAdd(1, _).WillReturn(2);

    // When calling twice with arguments accepted by both
    // Then the catch-all expectation is consumed first
    EXPECT_EQ(calculator_mock_.Add(1, 0), 1);

    // and once it is used up the call falls through to the specific one
    EXPECT_EQ(calculator_mock_.Add(1, 0), 2);
    EXPECT_TRUE(calculator_mock_.VerifyAndClearExpectations());
}

TEST_F(CalculatorMockFixture, ExpectationWithRemainingCallsIsPreferredOverLaterOnes)
{
    calculator_mock_.ExpectDivide(8, 2).Times(2).WillReturn(4);
    calculator_mock_.ExpectDivide(_, _).WillReturn(0);

    EXPECT_EQ(calculator_mock_.Divide(8, 2), 4);
    EXPECT_EQ(calculator_mock_.Divide(8, 2), 4);
    EXPECT_EQ(calculator_mock_.Divide(8, 2), 0);
    EXPECT_TRUE(calculator_mock_.VerifyAndClearExpectations());
}

TEST_F(CalculatorMockFixture, FacadeDispatchesEveryOperationToMock)
{
    // Given a facade dispatching to the mock
    const test::CalculatorMockFacade facade{calculator_mock_};
    const ICalculator& calculator = facade;

    calculator_mock_.ExpectAdd(1, 2).WillReturn(3);
    calculator_mock_.ExpectSubtract(5, 2).WillReturn(3);
    calculator_mock_.ExpectMultiply(3, 4).WillReturn(12);
    calculator_mock_.ExpectDivide(12, 4).WillReturn(3);

    // When calling the operations through the interface of the facade
    // Then the values returned by the mock are forwarded
    EXPECT_EQ(calculator.Add(1, 2), 3);
    EXPECT_EQ(calculator.Subtract(5, 2), 3);
    EXPECT_EQ(calculator.Multiply(3, 4), 12);
    EXPECT_EQ(calculator.Divide(12, 4), 3);
}

TEST(CalculatorOperationTest, ToStringNamesTheOperation)
{
    EXPECT_EQ(ToString(CalculatorOperation::kAdd), "Add");
    EXPECT_EQ(ToString(CalculatorOperation::kSubtract), "Subtract");
    EXPECT_EQ(ToString(CalculatorOperation::kMultiply), "Multiply");
    EXPECT_EQ(ToString(CalculatorOperation::kDivide), "Divide");
}

}  // namespace
}  // namespace calc
