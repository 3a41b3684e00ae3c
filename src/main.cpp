#include "Extension/CliHost.hpp"
#include "Extension/Downloader.hpp"
#include "Extension/Extension.hpp"
#include "Extension/ExtensionConfiguration.hpp"
#include "Extension/ReleaseFeed.hpp"
#include "FileUtils.hpp"
#include "argparse/argparse.hpp"

#include <iostream>
#include <iterator>
#include <optional>
#include <utility>

#ifndef BRIDGE_VERSION
#define BRIDGE_VERSION "0.0.0"
#endif

static std::optional<ExtensionConfiguration> loadConfiguration(const argparse::ArgumentParser& program)
{
    auto settingsPath = program.present<std::string>("--settings");
    if (!settingsPath)
        return ExtensionConfiguration{};

    std::optional<std::string> contents = FileUtils::readFile(*settingsPath);
    if (!contents)
    {
        std::cerr << "Failed to read settings at '" << *settingsPath << "'\n";
        return std::nullopt;
    }

    auto config = parseConfiguration(*contents);
    if (!config)
    {
        std::cerr << *settingsPath << ": " << config.error().message << '\n';
        return std::nullopt;
    }

    return config.value();
}

static int runResolution(const argparse::ArgumentParser& program, bool printCommand)
{
    auto config = loadConfiguration(program);
    if (!config)
        return 1;

    CliHost host;
    host.verbose = program.get<bool>("--verbose");
    GithubReleaseFeed releaseFeed{config->releasesApiUrl};
    HttpDownloader downloader;
    NextflowExtension extension(&host, &releaseFeed, &downloader, *config);

    auto serverId = program.get<std::string>("--server-id");
    auto command = extension.languageServerCommand(serverId);
    if (!command)
    {
        std::cerr << command.error().message << '\n';
        return 1;
    }

    if (printCommand)
        std::cout << json(command.value()).dump(2) << '\n';
    else
        std::cout << extension.artifactResolver().cachedPath().value_or("") << '\n';

    return 0;
}

static int startLabel(const argparse::ArgumentParser& program)
{
    std::string contents;
    if (auto inputPath = program.present<std::string>("--input"))
    {
        std::optional<std::string> file = FileUtils::readFile(*inputPath);
        if (!file)
        {
            std::cerr << "Failed to read completion items at '" << *inputPath << "'\n";
            return 1;
        }
        contents = std::move(*file);
    }
    else
    {
        contents.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    auto labelToJson = [](const std::optional<CodeLabel>& label) -> json
    {
        if (!label)
            return nullptr;
        return *label;
    };

    try
    {
        json input = json::parse(contents);
        if (input.is_array())
        {
            json output = json::array();
            for (const auto& item : input)
                output.emplace_back(labelToJson(labelForCompletion(item.get<lsp::CompletionItem>())));
            std::cout << output.dump(2) << '\n';
        }
        else
        {
            std::cout << labelToJson(labelForCompletion(input.get<lsp::CompletionItem>())).dump(2) << '\n';
        }
    }
    catch (const json::exception& e)
    {
        std::cerr << "Invalid completion items: " << e.what() << '\n';
        return 1;
    }

    return 0;
}

int main(int argc, char** argv)
{
    argparse::ArgumentParser program("nextflow-ls-bridge", BRIDGE_VERSION);

    // Global arguments
    argparse::ArgumentParser parent_parser("-", "0.0", argparse::default_arguments::none);
    parent_parser.add_argument("--server-id").help("identifier of the language server being launched").default_value(std::string("nextflow"));
    parent_parser.add_argument("--settings").help("path to a JSON settings file for the extension").metavar("PATH");
    parent_parser.add_argument("--verbose").help("print detailed log messages").default_value(false).implicit_value(true);

    argparse::ArgumentParser command_command("command");
    command_command.add_description("Install the language server if needed and print the command used to launch it");
    command_command.add_epilog("The command is printed as a JSON object with 'command', 'args' and 'env' fields");
    command_command.add_parents(parent_parser);

    argparse::ArgumentParser install_command("install");
    install_command.add_description("Install the language server if needed and print the path to the installed jar");
    install_command.add_parents(parent_parser);

    argparse::ArgumentParser label_command("label");
    label_command.add_description("Render code labels for language server completion items");
    label_command.add_epilog("Reads a completion item, or a list of them, as JSON. Prints a code label (or null) for each item");
    label_command.add_parents(parent_parser);
    label_command.add_argument("--input").help("file to read completion items from instead of stdin").metavar("PATH");

    program.add_subparser(command_command);
    program.add_subparser(install_command);
    program.add_subparser(label_command);

    try
    {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err)
    {
        std::cerr << err.what() << '\n';
        std::cerr << program;
        return 1;
    }

    if (program.is_subcommand_used("command"))
        return runResolution(command_command, /* printCommand= */ true);
    else if (program.is_subcommand_used("install"))
        return runResolution(install_command, /* printCommand= */ false);
    else if (program.is_subcommand_used("label"))
        return startLabel(label_command);

    // No sub-command specified
    std::cerr << "Specify a particular mode to run the program (command/install/label)" << '\n';
    std::cerr << program;
    return 1;
}
