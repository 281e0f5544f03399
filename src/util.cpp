// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2017 The Bitcoin Core developers
// Copyright (c) 2024 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>

#include <utilstrencodings.h>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <stdexcept>
#include <typeinfo>

const char * const BACKED_CONF_FILENAME = "backed.conf";

ArgsManager gArgs;
bool fPrintToConsole = false;
bool fPrintToDebugLog = true;
bool fLogTimestamps = DEFAULT_LOGTIMESTAMPS;

/** Log categories bitfield. */
std::atomic<uint32_t> logCategories(0);

/** Debug log file, opened by -debuglogfile. Released only through CloseDebugLog(). */
static CCriticalSection cs_debugLog;
static FILE* fileout = nullptr;

/**
 * fStartedNewLine is a state variable held by the calling context that will
 * suppress printing of the timestamp when multiple calls are made that don't
 * end in a newline.
 */
static std::atomic_bool fStartedNewLine(true);

struct CLogCategoryDesc
{
    uint32_t flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {BCLog::NONE, "0"},
    {BCLog::SETTLEMENT, "settlement"},
    {BCLog::QUEUE, "queue"},
    {BCLog::BRIDGE, "bridge"},
    {BCLog::PRICING, "pricing"},
    {BCLog::CONFIG, "config"},
    {BCLog::ALL, "1"},
    {BCLog::ALL, "all"},
};

bool GetLogCategory(uint32_t *f, const std::string *str)
{
    if (f && str) {
        if (*str == "") {
            *f = BCLog::ALL;
            return true;
        }
        for (unsigned int i = 0; i < sizeof(LogCategories) / sizeof(LogCategories[0]); i++) {
            if (LogCategories[i].category == *str) {
                *f = LogCategories[i].flag;
                return true;
            }
        }
    }
    return false;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (unsigned int i = 0; i < sizeof(LogCategories) / sizeof(LogCategories[0]); i++) {
        // Omit the special cases.
        if (LogCategories[i].flag != BCLog::NONE && LogCategories[i].flag != BCLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += LogCategories[i].category;
            outcount++;
        }
    }
    return ret;
}

static std::string LogTimestampStr(const std::string &str)
{
    std::string strStamped;

    if (!fLogTimestamps)
        return str;

    if (fStartedNewLine) {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tmUtc;
        gmtime_r(&now, &tmUtc);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmUtc);
        strStamped = std::string(buf) + ' ' + str;
    } else
        strStamped = str;

    if (!str.empty() && str[str.size()-1] == '\n')
        fStartedNewLine = true;
    else
        fStartedNewLine = false;

    return strStamped;
}

int LogPrintStr(const std::string &str)
{
    int ret = 0; // Returns total number of characters written
    std::string strTimestamped = LogTimestampStr(str);

    if (fPrintToConsole)
    {
        // print to console
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }
    if (fPrintToDebugLog)
    {
        LOCK(cs_debugLog);
        if (fileout != nullptr) {
            ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), fileout);
        }
    }
    return ret;
}

bool OpenDebugLog(const std::string& path)
{
    LOCK(cs_debugLog);
    if (fileout != nullptr) {
        fclose(fileout);
    }
    fileout = fopen(path.c_str(), "a");
    if (!fileout) {
        return false;
    }
    setbuf(fileout, nullptr); // unbuffered
    return true;
}

void CloseDebugLog()
{
    LOCK(cs_debugLog);
    if (fileout != nullptr) {
        fclose(fileout);
        fileout = nullptr;
    }
}

static std::string FormatException(const std::exception* pex, const char* pszThread)
{
    if (pex)
        return strprintf(
            "EXCEPTION: %s       \n%s       \n%s in %s       \n", typeid(*pex).name(), pex->what(), "backed", pszThread);
    else
        return strprintf(
            "UNKNOWN EXCEPTION       \n%s in %s       \n", "backed", pszThread);
}

void PrintExceptionContinue(const std::exception* pex, const char* pszThread)
{
    std::string message = FormatException(pex, pszThread);
    LogPrintf("\n\n************************\n%s\n", message);
    fprintf(stderr, "\n\n************************\n%s\n", message.c_str());
}

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegativeSetting(std::string& strKey, std::string& strValue)
{
    if (strKey.length()>3 && strKey[0]=='-' && strKey[1]=='n' && strKey[2]=='o')
    {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::vector<std::string>& positional, std::string& error)
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
    positional.clear();

    for (int i = 1; i < argc; i++)
    {
        std::string key(argv[i]);
        std::string val;
        if (!IsSwitchChar(key[0])) {
            // Everything from the first non-option on is positional
            for (int j = i; j < argc; j++) {
                positional.push_back(argv[j]);
            }
            break;
        }

        size_t is_index = key.find('=');
        if (is_index != std::string::npos)
        {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        // Transform --foo to -foo
        if (key.length() > 1 && key[1] == '-')
            key = key.substr(1);

        if (key.length() < 2) {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        InterpretNegativeSetting(key, val);

        mapArgs[key] = val;
        mapMultiArgs[key].push_back(val);
    }
    return true;
}

void ArgsManager::ReadConfigFile(const std::string& confPath)
{
    std::ifstream streamConfig(confPath);
    if (!streamConfig.good())
        return; // No config file is OK

    {
        LOCK(cs_args);
        std::map<std::string, std::string> mapFile;
        std::string line;
        int nLine = 0;
        while (std::getline(streamConfig, line)) {
            ++nLine;
            size_t comment = line.find('#');
            if (comment != std::string::npos) {
                line.erase(comment);
            }
            line = TrimString(line);
            if (line.empty()) {
                continue;
            }
            size_t eq = line.find('=');
            std::string strKey = "-" + TrimString(eq == std::string::npos ? line : line.substr(0, eq));
            std::string strValue = eq == std::string::npos ? std::string() : TrimString(line.substr(eq + 1));
            if (strKey.size() < 2) {
                throw std::runtime_error(strprintf("parse error on line %i of %s", nLine, confPath));
            }
            InterpretNegativeSetting(strKey, strValue);
            // Don't overwrite existing settings so command line settings override the config file
            if (mapArgs.count(strKey) == 0)
                mapFile[strKey] = strValue;
            mapMultiArgs[strKey].push_back(strValue);
        }
        for (const auto& entry : mapFile) {
            mapArgs[entry.first] = entry.second;
        }
    }
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    auto it = mapMultiArgs.find(strArg);
    if (it != mapMultiArgs.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return mapArgs.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return it->second;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return atoi64(it->second);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return InterpretBool(it->second);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

bool ArgsManager::SoftSetBoolArg(const std::string& strArg, bool fValue)
{
    if (fValue)
        return SoftSetArg(strArg, std::string("1"));
    else
        return SoftSetArg(strArg, std::string("0"));
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string &message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string &option, const std::string &message) {
    std::string ret = std::string(optIndent,' ') + std::string(option) +
           std::string("\n") + std::string(msgIndent,' ');
    // Wrap the message at word boundaries
    size_t col = msgIndent;
    for (const std::string& word : SplitWords(message)) {
        if (col > msgIndent && col + 1 + word.size() > static_cast<size_t>(screenWidth)) {
            ret += "\n" + std::string(msgIndent, ' ');
            col = msgIndent;
        } else if (col > msgIndent) {
            ret += ' ';
            col++;
        }
        ret += word;
        col += word.size();
    }
    return ret + std::string("\n\n");
}

bool InitLogging(std::string& error)
{
    fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", false);
    fLogTimestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    uint32_t categories = BCLog::NONE;
    if (gArgs.IsArgSet("-debug")) {
        for (const std::string& cat : gArgs.GetArgs("-debug")) {
            uint32_t flag = 0;
            if (!GetLogCategory(&flag, &cat)) {
                error = strprintf("Unsupported logging category -debug=%s (available: %s)", cat, ListLogCategories());
                return false;
            }
            categories |= flag;
        }
    }
    logCategories = categories;

    if (gArgs.IsArgSet("-debuglogfile")) {
        std::string path = gArgs.GetArg("-debuglogfile", "");
        if (!OpenDebugLog(path)) {
            error = strprintf("Could not open debug log file %s", path);
            return false;
        }
    }
    return true;
}
