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
#include "calc/application/application_configuration.h"

#include "calc/calculator/calculator_error.h"

#include "score/mw/log/logging.h"

#include <boost/program_options.hpp>

#include <sstream>
#include <utility>
#include <vector>

namespace calc
{

namespace
{

namespace po = boost::program_options;

using std::string_view_literals::operator""sv;

constexpr auto kExternalBackendName = "external"sv;
constexpr auto kLocalBackendName = "local"sv;
constexpr auto kDefaultServiceIdentifier = "calculator_service";

constexpr auto kHelpKey = "help";
constexpr auto kBackendKey = "backend";
constexpr auto kServiceIdentifierKey = "service_identifier";
constexpr auto kInputKey = "input";

}  // namespace

score::Result<CalculatorBackend> ParseCalculatorBackend(const std::string_view name) noexcept
{
    if (name == kExternalBackendName)
    {
        return CalculatorBackend::kExternal;
    }
    if (name == kLocalBackendName)
    {
        return CalculatorBackend::kLocal;
    }
    return score::MakeUnexpected(CalculatorErrc::kUnknownBackend);
}

ApplicationConfiguration::ApplicationConfiguration()
    : ApplicationConfiguration{CalculatorBackend::kExternal, kDefaultServiceIdentifier, 0}
{
}

ApplicationConfiguration::ApplicationConfiguration(const CalculatorBackend backend,
                                                   std::string service_identifier,
                                                   const std::int32_t input)
    : backend_{backend},
      service_identifier_{std::move(service_identifier)},
      input_{input},
      help_requested_{false},
      usage_{}
{
}

// NOLINTNEXTLINE(modernize-avoid-c-arrays):C-style array tolerated for command line arguments
score::Result<ApplicationConfiguration> ApplicationConfiguration::FromCommandLine(const std::int32_t argc,
                                                                                  const char* const argv[]) noexcept
{
    ApplicationConfiguration configuration{};
    std::string backend_name{kExternalBackendName};

    po::options_description options{"calc_app options"};
    // clang-format off
    options.add_options()
        (kHelpKey, "Display the help message")
        (kBackendKey, po::value<std::string>(&backend_name)->default_value(backend_name), "Calculator backend: external or local")
        (kServiceIdentifierKey, po::value<std::string>(&configuration.service_identifier_)->default_value(configuration.service_identifier_), "Name of the external calculation service")
        (kInputKey, po::value<std::int32_t>(&configuration.input_)->default_value(configuration.input_), "Input of the algorithm");
    // clang-format on

    // argv[0] is the application name
    const std::vector<std::string> arguments =
        (argc > 1) ? std::vector<std::string>(argv + 1, argv + argc) : std::vector<std::string>{};

    try
    {
        po::variables_map args;
        const auto parsed_args =
            po::command_line_parser{arguments}
                .options(options)
                .style(po::command_line_style::unix_style | po::command_line_style::allow_long_disguise)
                .run();
        po::store(parsed_args, args);

        if (args.count(kHelpKey) > 0U)
        {
            std::ostringstream usage{};
            usage << options;
            configuration.help_requested_ = true;
            configuration.usage_ = usage.str();
            return configuration;
        }

        po::notify(args);
    }
    catch (const po::error& error)
    {
        score::mw::log::LogError("calc") << "Invalid command line:" << std::string{error.what()};
        return score::MakeUnexpected(CalculatorErrc::kInvalidCommandLine);
    }

    const auto backend_result = ParseCalculatorBackend(backend_name);
    if (!backend_result.has_value())
    {
        score::mw::log::LogError("calc") << "Unknown backend" << backend_name << ". Supported are"
                                         << std::string{kExternalBackendName} << "and"
                                         << std::string{kLocalBackendName};
        return score::MakeUnexpected<ApplicationConfiguration>(backend_result.error());
    }
    configuration.backend_ = backend_result.value();
    return configuration;
}

CalculatorBackend ApplicationConfiguration::GetBackend() const noexcept
{
    return backend_;
}

const std::string& ApplicationConfiguration::GetServiceIdentifier() const noexcept
{
    return service_identifier_;
}

std::int32_t ApplicationConfiguration::GetInput() const noexcept
{
    return input_;
}

bool ApplicationConfiguration::IsHelpRequested() const noexcept
{
    return help_requested_;
}

const std::string& ApplicationConfiguration::GetUsage() const noexcept
{
    return usage_;
}

}  // namespace calc
