// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file LICENSE or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing
 */
#ifndef DSC_UTIL_SYSTEM_H
#define DSC_UTIL_SYSTEM_H

#include <fs.h>
#include <logging.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

extern const char * const DSC_CONF_FILENAME;

class ArgsManager
{
protected:
    mutable std::mutex cs_args;
    std::map<std::string, std::vector<std::string>> m_override_args;
    std::map<std::string, std::vector<std::string>> m_config_args;

    bool ReadConfigStream(std::istream& stream, const std::string& filepath, std::string& error);

public:
    ArgsManager() = default;

    /**
     * Parses "-name=value" and "-name" arguments. A leading double dash is
     * accepted as well, "-noname" sets name to 0.
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /**
     * Reads "name=value" lines. Command line values take precedence over
     * the file, '#' starts a comment.
     */
    bool ReadConfigFile(const fs::path& path, std::string& error);
    bool ReadConfigString(const std::string& content, std::string& error);

    /** Path of the config file named by -conf, relative paths stay relative to the working directory */
    fs::path GetConfigFile() const;

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return true if the argument was originally passed as a negated option,
     * i.e. -nofoo.
     */
    bool IsArgNegated(const std::string& strArg) const;

    /**
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);
    void ForceSetMultiArg(const std::string& strArg, const std::vector<std::string>& values);

    /**
     * Set an argument if it doesn't already have a value
     *
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    void ClearArgs();

private:
    bool GetLast(const std::string& strArg, std::string& value) const;
};

extern ArgsManager gArgs;

/** Applies -debug, -printtoconsole and -debuglogfile to the global logger */
bool InitLogging(const ArgsManager& args, std::string& error);

#endif // DSC_UTIL_SYSTEM_H
