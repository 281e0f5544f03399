// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <backed/backed_config.h>
#include <backed/simulator.h>
#include <util.h>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static const int CONTINUE_EXECUTION = -1;

static std::string HelpMessage()
{
    std::string strUsage = "Usage:\n"
        "  backed-sim [options] [command [args] [; command [args] ...]]\n"
        "  backed-sim [options] < commands.txt\n\n"
        "Commands: mint, approve, buy, redeem, deposit, withdraw, process, forward,\n"
        "settle, setprice, bridgefail, balance, status\n\n";

    strUsage += HelpMessageGroup("General options:");
    strUsage += HelpMessageOpt("-?", "Print this help message and exit");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Read options from <file> (default: %s)", BACKED_CONF_FILENAME));

    strUsage += HelpMessageGroup("Logging options:");
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information for <category> (repeatable, 1 or all for everything). "
        "Categories: " + ListLogCategories());
    strUsage += HelpMessageOpt("-printtoconsole", "Send log output to the console (default: 0)");
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend log lines with a timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt("-debuglogfile=<file>", "Append log output to <file>");

    strUsage += backed::GetBackedHelpMessage();
    return strUsage;
}

/** Split positional tokens into commands separated by ";" */
static std::vector<std::vector<std::string>> GroupCommands(const std::vector<std::string>& tokens)
{
    std::vector<std::vector<std::string>> commands(1);
    for (const std::string& token : tokens) {
        if (token == ";") {
            if (!commands.back().empty()) commands.emplace_back();
            continue;
        }
        commands.back().push_back(token);
    }
    if (commands.back().empty()) commands.pop_back();
    return commands;
}

static int AppInitSim(int argc, char* argv[], std::vector<std::string>& positional)
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, positional, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        fprintf(stdout, "%s", HelpMessage().c_str());
        return EXIT_SUCCESS;
    }

    try {
        gArgs.ReadConfigFile(gArgs.GetArg("-conf", BACKED_CONF_FILENAME));
    } catch (const std::exception& e) {
        fprintf(stderr, "Error reading configuration file: %s\n", e.what());
        return EXIT_FAILURE;
    }

    // -debug without a log file writes to the console
    if (gArgs.IsArgSet("-debug") && !gArgs.IsArgSet("-debuglogfile")) {
        gArgs.SoftSetBoolArg("-printtoconsole", true);
    }

    if (!InitLogging(error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    return CONTINUE_EXECUTION;
}

static int RunCommands(backed::Simulator& sim, const std::vector<std::string>& positional)
{
    int nRet = EXIT_SUCCESS;
    std::string strOutput;

    if (!positional.empty()) {
        for (const std::vector<std::string>& words : GroupCommands(positional)) {
            bool ok = sim.Execute(words, strOutput);
            sim.GetBridge().ProcessNotifications();
            fprintf(ok ? stdout : stderr, "%s\n", strOutput.c_str());
            if (!ok) {
                return EXIT_FAILURE;
            }
        }
        return nRet;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        bool ok = sim.ExecuteLine(line, strOutput);
        if (!strOutput.empty()) {
            fprintf(ok ? stdout : stderr, "%s\n", strOutput.c_str());
        }
        if (!ok) {
            nRet = EXIT_FAILURE;
        }
    }
    return nRet;
}

int main(int argc, char* argv[])
{
    std::vector<std::string> positional;
    int ret = AppInitSim(argc, argv, positional);
    if (ret != CONTINUE_EXECUTION) {
        return ret;
    }

    try {
        backed::EngineConfig config;
        std::string error;
        if (!backed::InitEngineConfig(config, error)) {
            fprintf(stderr, "Error: %s\n", error.c_str());
            ret = EXIT_FAILURE;
        } else {
            backed::Simulator sim(config);
            ret = RunCommands(sim, positional);
        }
    } catch (const std::exception& e) {
        PrintExceptionContinue(&e, "backed-sim");
        ret = EXIT_FAILURE;
    }

    CloseDebugLog();
    return ret;
}
