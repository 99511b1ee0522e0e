/*
 * Copyright (C) 2025 James C. Owens
 * Portions Copyright (c) 2019 The Bitcoin Core developers
 * Portions Copyright (c) 2025 The Gridcoin developers
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <util.h>
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <regex>
#include <fstream>

//!
//! \brief This to support early use of the log utility functions before the config is read to get the
//! debug flag.
//!
std::atomic<bool> g_debug = false;

//!
//! \brief The flag controls the logging of timestamps by the log functions. This is used to suppress
//! timestamp output when the output is consumed by a launcher that timestamps lines itself.
//!
std::atomic<bool> g_log_timestamps = true;

[[nodiscard]] std::vector<std::string> StringSplit(const std::string& s, const std::string& delim)
{
    size_t pos = 0;
    size_t end = 0;
    std::vector<std::string> elems;

    while((end = s.find(delim, pos)) != std::string::npos)
    {
        elems.push_back(s.substr(pos, end - pos));
        pos = end + delim.size();
    }

    // Append final value
    elems.push_back(s.substr(pos, end - pos));
    return elems;
}

[[nodiscard]] std::string TrimString(const std::string& str, const std::string& pattern)
{
    std::string::size_type front = str.find_first_not_of(pattern);
    if (front == std::string::npos) {
        return std::string();
    }
    std::string::size_type end = str.find_last_not_of(pattern);
    return str.substr(front, end - front + 1);
}

[[nodiscard]] std::string StripQuotes(const std::string& str)
{
    if (str.empty()) {
        return str;
    }

    std::string result = str;

    if (result.front() == '"' || result.front() == '\'') {
        result.erase(0, 1);
    }

    if (!result.empty() && (result.back() == '"' || result.back() == '\'')) {
        result.pop_back();
    }

    return result;
}

[[nodiscard]] bool EndsWith(const std::string& str, const std::string& suffix)
{
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string ToLower(const std::string& str)
{
    std::string r;
    for (auto ch : str) r += ToLower((unsigned char)ch);
    return r;
}

int64_t GetUnixEpochTime()
{
    auto now = std::chrono::system_clock::now();

    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string FormatISO8601DateTime(int64_t time)
{
    struct tm ts;
    time_t time_val = time;
    if (gmtime_r(&time_val, &ts) == nullptr) {
        return {};
    }

    return strprintf("%04i-%02i-%02iT%02i:%02i:%02iZ",
                     ts.tm_year + 1900, ts.tm_mon + 1, ts.tm_mday, ts.tm_hour, ts.tm_min, ts.tm_sec);
}

[[nodiscard]] int ParseStringToInt(const std::string& str)
{
    try {
        return std::stoi(str);
    } catch (const std::invalid_argument& e){
        error_log("%s: Invalid argument: %s",
                  __func__,
                  e.what());
        throw;
    } catch (const std::out_of_range& e){
        error_log("%s: Out of range: %s",
                  __func__,
                  e.what());
        throw;
    }
}

std::vector<fs::path> FindDirEntriesWithWildcard(const fs::path& directory, const std::string& wildcard)
{
    std::vector<fs::path> matching_entries;
    std::regex regex_wildcard(wildcard); //convert wildcard to regex.

    std::error_code ec;
    if (!fs::exists(directory, ec) || !fs::is_directory(directory, ec)) {
        debug_log("WARNING: %s, directory %s to search for regex expression \"%s\" "
                  "does not exist or is not a directory.",
                  __func__,
                  directory,
                  wildcard);

        return matching_entries;
    }

    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (std::regex_match(entry.path().filename().string(), regex_wildcard)) {
            matching_entries.push_back(entry.path());
        }
    }

    // directory_iterator order is unspecified.
    std::sort(matching_entries.begin(), matching_entries.end());

    return matching_entries;
}

std::optional<std::string> GetEnvVariable(const std::string& var_name)
{
    const char* value = std::getenv(var_name.c_str());

    if (value == nullptr) {
        return std::nullopt;
    }

    return std::string(value);
}

// Class Config

Config::Config()
{}

void Config::ReadAndUpdateConfig(const fs::path& config_file) {
    std::unique_lock<std::mutex> lock(mtx_config);

    std::multimap<std::string, std::string> config;

    try {
        std::ifstream file(config_file);

        if (!file.is_open()) {
            throw FileSystemException("Could not open the config file.", config_file);
        }

        std::string line;
        while (std::getline(file, line)) {
            // Skip empty lines and lines starting with '#'
            if (line.empty() || line[0] == '#') {
                continue;
            }

            std::vector line_elements = StringSplit(line, "=");

            if (line_elements.size() != 2) {
                continue;
            }

            config.insert(std::make_pair(StripQuotes(TrimString(line_elements[0])),
                                         StripQuotes(TrimString(line_elements[1]))));
        }

        file.close();

        // Do this all at once so the result of the config read is essentially "atomic".
        m_config_in.swap(config);
    } catch (FileSystemException& e) {
        debug_log("INFO: %s: Reading config file failed, so defaults will be used: %s",
                  __func__,
                  e.what());

        m_config_in.clear();
    }

    // If the config file read failed, we will process args anyway, which will result in defaults being chosen.
    m_config.clear();
    ProcessArgs();
}

config_variant Config::GetArg(const std::string& arg)
{
    std::unique_lock<std::mutex> lock(mtx_config);

    auto iter = m_config.find(arg);

    if (iter != m_config.end()) {
        return iter->second;
    } else {
        return std::string {};
    }
}

std::string Config::GetArgString(const std::string& arg, const std::string& default_value) const
{
    auto iter = m_config_in.find(arg);

    if (iter != m_config_in.end()) {
        return iter->second;
    } else {
        return default_value;
    }
}

void Config::ProcessBoolArg(const std::string& arg, bool default_value)
{
    std::string value = GetArgString(arg, default_value ? "true" : "false");

    if (value == "1" || ToLower(value) == "true") {
        m_config.insert(std::make_pair(arg, true));
    } else if (value == "0" || ToLower(value) == "false") {
        m_config.insert(std::make_pair(arg, false));
    } else {
        error_log("%s: %s parameter in config file has invalid value: %s",
                  __func__,
                  arg,
                  value);

        m_config.insert(std::make_pair(arg, default_value));
    }
}
