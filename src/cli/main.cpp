//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "setup_logging.hpp"

#include "config/config.hpp"
#include "logging.hpp"

#include <docmap/sdk/catalog_client.hpp>
#include <docmap/sdk/index_manager.hpp>
#include <docmap/sdk/index_spec.hpp>
#include <docmap/sdk/schema_registry.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace
{

using docmap::common::config::Config;
using docmap::sdk::IndexManager;

struct Arguments final
{
    std::string config_file{"./docmap.toml"};
    bool        ensure{false};
};

Arguments parseArguments(const int argc, const char** const argv)
{
    static const std::string config_prefix = "--config=";

    Arguments args;
    if (const auto* const env_config = std::getenv("DOCMAP_CONFIG"))
    {
        args.config_file = env_config;
    }
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg_str.find(config_prefix) == 0)
        {
            args.config_file = arg_str.substr(config_prefix.size());
        }
        else if (arg_str == "--ensure")
        {
            args.ensure = true;
        }
    }
    return args;
}

std::string describeFailure(const IndexManager::EnsureIndexes::Failure& failure)
{
    using namespace docmap::sdk;  // NOLINT

    return cetl::visit(  //
        cetl::make_overloaded(
            [](const NotRegisteredError& error) { return "Schema '" + error.schema_name + "' is not registered."; },
            [](const ConfigError& error) { return "Invalid configuration: " + error.message; },
            [](const IndexConflictError& error) { return "Index conflict: " + error.message; },
            [](const TransportError& error) {
                return "Store failure (code=" + std::to_string(error.code) + "): " + error.message;
            }),
        failure);
}

void printSpecs(const char* const title, const docmap::sdk::IndexSpecs& specs)
{
    std::cout << "  " << title << ":\n";
    for (const auto& spec : specs)
    {
        std::cout << "    " << spec.name() << "  " << spec.toString() << '\n';
    }
}

int run(const Arguments& args, const Config& config)
{
    const auto logger = docmap::common::getLogger(docmap::common::LoggerName::Cli);

    auto documents = config.getDocuments();
    if (const auto* const error = cetl::get_if<Config::Documents::Failure>(&documents))
    {
        std::cerr << "Invalid documents: " << error->message << '\n';
        return EXIT_FAILURE;
    }

    const auto registry    = docmap::sdk::SchemaRegistry::make();
    const auto schema_defs = cetl::get<Config::Documents::Success>(std::move(documents));
    for (const auto& schema_def : schema_defs)
    {
        auto defined = registry->define(schema_def);
        if (const auto* const error = cetl::get_if<docmap::sdk::SchemaRegistry::Define::Failure>(&defined))
        {
            std::cerr << "Invalid document '" << schema_def.name << "': " << error->message << '\n';
            return EXIT_FAILURE;
        }
    }
    logger->info("Registered {} document(s).", registry->size());

    const auto catalog       = docmap::sdk::CatalogClient::makeInMemory();
    const auto index_manager = IndexManager::make(registry, catalog, config.getConnectionSettings());
    if (!index_manager)
    {
        std::cerr << "Failed to create index manager.\n";
        return EXIT_FAILURE;
    }

    for (const auto& schema_def : schema_defs)
    {
        std::cout << schema_def.name << '\n';

        auto specs = index_manager->compileIndexSpecs(schema_def.name);
        if (const auto* const compiled = cetl::get_if<IndexManager::CompileIndexSpecs::Success>(&specs))
        {
            printSpecs("indexes", *compiled);
        }
        auto geo_specs = index_manager->geoIndexes(schema_def.name);
        if (const auto* const geo = cetl::get_if<IndexManager::GeoIndexes::Success>(&geo_specs))
        {
            printSpecs("geo indexes", *geo);
        }

        const auto* const schema = registry->find(schema_def.name);
        if (!args.ensure || (schema == nullptr) || !schema->hasCollection())
        {
            continue;
        }
        if (const auto failure = index_manager->ensureIndexes(schema_def.name))
        {
            const auto description = describeFailure(*failure);
            logger->error("Failed to ensure indexes of '{}': {}", schema_def.name, description);
            std::cerr << "Failed to ensure indexes of '" << schema_def.name << "': " << description << '\n';
            return EXIT_FAILURE;
        }

        auto listed = catalog->listIndexes(schema->collection);
        if (const auto* const entries = cetl::get_if<docmap::sdk::CatalogClient::ListIndexes::Success>(&listed))
        {
            std::cout << "  catalog of '" << schema->collection << "':\n";
            for (const auto& entry : *entries)
            {
                std::cout << "    " << entry.name << '\n';
            }
        }
    }
    return EXIT_SUCCESS;
}

}  // namespace

int main(const int argc, const char** const argv)
{
    const auto args = parseArguments(argc, argv);

    auto loaded = Config::make(args.config_file);
    if (const auto* const error = cetl::get_if<Config::Load::Failure>(&loaded))
    {
        std::cerr << "Failed to load config '" << args.config_file << "': " << error->message << '\n';
        return EXIT_FAILURE;
    }
    const auto config = cetl::get<Config::Load::Success>(std::move(loaded));

    setupLogging(argc, argv, *config);

    spdlog::info("docmap client started (ver='{}.{}').", VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_SUCCESS;
    try
    {
        result = run(args, *config);

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("docmap client terminated (result={}).", result);

    return result;
}
