// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

#include <util/system.h>

#include <boost/algorithm/string/trim.hpp>

#include <cstdlib>
#include <sstream>

const char * const DSC_CONF_FILENAME = "dsc.conf";

ArgsManager gArgs;

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (std::atoi(strValue.c_str()) != 0);
}

/** Turns -noX into -X=0 */
static void InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        key.erase(1, 2);
        if (!bool_val) {
            // Double negatives like -nofoo=0 are supported (but discouraged)
            LogPrintf("Warning: parsed potentially confusing double-negative %s=%s\n", key, val);
            val = "1";
        } else {
            val = "0";
        }
    }
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key[0] != '-')
            break;

        // Transform --foo to -foo
        if (key.length() > 1 && key[1] == '-')
            key.erase(0, 1);

        if (key.length() < 2) {
            error = tfm::format("Invalid parameter %s", argv[i]);
            return false;
        }

        InterpretNegatedOption(key, val);
        m_override_args[key].push_back(val);
    }
    return true;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, const std::string& filepath, std::string& error)
{
    std::string str;
    int linenr = 1;
    while (std::getline(stream, str)) {
        bool used_hash = false;
        if (size_t pos = str.find('#'); pos != std::string::npos) {
            str = str.substr(0, pos);
            used_hash = true;
        }
        boost::algorithm::trim(str);
        if (!str.empty()) {
            if (str[0] == '-') {
                error = tfm::format("parse error on line %i: %s, options in configuration file must be specified without leading -", linenr, str);
                return false;
            }
            const size_t pos = str.find('=');
            if (pos == std::string::npos) {
                error = tfm::format("parse error on line %i: %s%s", linenr, str, used_hash ? ", if you intended to specify a value with a '#' in it, use quotes" : "");
                return false;
            }
            std::string key = "-" + boost::algorithm::trim_copy(str.substr(0, pos));
            std::string value = boost::algorithm::trim_copy(str.substr(pos + 1));
            InterpretNegatedOption(key, value);
            m_config_args[key].push_back(value);
        }
        ++linenr;
    }
    LogPrint(BCLog::ENGINE, "read configuration from %s\n", filepath);
    return true;
}

bool ArgsManager::ReadConfigString(const std::string& content, std::string& error)
{
    std::istringstream stream(content);
    std::lock_guard<std::mutex> lock(cs_args);
    m_config_args.clear();
    return ReadConfigStream(stream, "<string>", error);
}

bool ArgsManager::ReadConfigFile(const fs::path& path, std::string& error)
{
    {
        std::lock_guard<std::mutex> lock(cs_args);
        m_config_args.clear();
    }

    fsbridge::ifstream stream(path);
    if (!stream.good()) {
        // a missing default config file is not an error
        if (IsArgSet("-conf")) {
            error = tfm::format("specified config file \"%s\" could not be opened.", path.string());
            return false;
        }
        return true;
    }

    std::lock_guard<std::mutex> lock(cs_args);
    return ReadConfigStream(stream, path.string(), error);
}

fs::path ArgsManager::GetConfigFile() const
{
    return fs::path(GetArg("-conf", DSC_CONF_FILENAME));
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) {
        return it->second;
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) {
        return it->second;
    }
    return {};
}

bool ArgsManager::GetLast(const std::string& strArg, std::string& value) const
{
    const auto values = GetArgs(strArg);
    if (values.empty()) {
        return false;
    }
    value = values.back();
    return true;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::string value;
    return GetLast(strArg, value);
}

bool ArgsManager::IsArgNegated(const std::string& strArg) const
{
    std::string value;
    return GetLast(strArg, value) && value == "0";
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::string value;
    return GetLast(strArg, value) ? value : strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::string value;
    return GetLast(strArg, value) ? std::atoll(value.c_str()) : nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::string value;
    return GetLast(strArg, value) ? InterpretBool(value) : fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args[strArg] = {strValue};
}

void ArgsManager::ForceSetMultiArg(const std::string& strArg, const std::vector<std::string>& values)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args[strArg] = values;
}

void ArgsManager::ClearArgs()
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args.clear();
    m_config_args.clear();
}

bool InitLogging(const ArgsManager& args, std::string& error)
{
    auto& logger = LogInstance();
    logger.m_print_to_console = args.GetBoolArg("-printtoconsole", false);
    logger.m_log_timestamps = args.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);
    logger.m_log_time_micros = args.GetBoolArg("-logtimemicros", DEFAULT_LOGTIMEMICROS);
    logger.m_print_to_file = !args.IsArgNegated("-debuglogfile");
    logger.m_file_path = fs::absolute(args.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE));

    for (const auto& cat : args.GetArgs("-debug")) {
        if (!logger.EnableCategory(cat)) {
            error = tfm::format("Unsupported logging category %s=%s.", "-debug", cat);
            return false;
        }
    }
    for (const auto& cat : args.GetArgs("-debugexclude")) {
        if (!logger.DisableCategory(cat)) {
            error = tfm::format("Unsupported logging category %s=%s.", "-debugexclude", cat);
            return false;
        }
    }
    if (!logger.StartLogging()) {
        error = tfm::format("Could not open debug log file %s", logger.m_file_path.string());
        return false;
    }
    return true;
}
