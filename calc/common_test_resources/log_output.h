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
#ifndef CALC_COMMON_TEST_RESOURCES_LOG_OUTPUT_H
#define CALC_COMMON_TEST_RESOURCES_LOG_OUTPUT_H

#include <unistd.h>
#include <cstdio>
#include <cstdlib>

namespace calc::test
{

/// \brief Routes stdout, where mw::log writes its console output, to stderr.
///
/// Death tests only match their regex against the stderr output of the dying process. Call this at the start of the
/// death test statement to be able to match on log messages written right before termination.
inline void RedirectLogOutputToStderr() noexcept
{
    if (std::fflush(stdout) != 0)
    {
        std::_Exit(EXIT_FAILURE);
    }
    if (::dup2(STDERR_FILENO, STDOUT_FILENO) == -1)
    {
        std::_Exit(EXIT_FAILURE);
    }
}

}  // namespace calc::test

#endif  // CALC_COMMON_TEST_RESOURCES_LOG_OUTPUT_H
