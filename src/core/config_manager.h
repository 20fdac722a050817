/*
 * <Configuration manager: defaults merged with user input>
 * Copyright (C) 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#pragma once

#include <algorithm>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

/*! \brief Configuration of one capability
 *
 * The capability hands its static default json and the user input (command
 * line or control file) to the constructor. User keys are matched against the
 * defaults case-insensitively and override them, unknown user keys are kept.
 *
 * Usage:
 *   ConfigManager config("clusterbatch", ClusterBatchJson, controller);
 *   std::string method = config.get<std::string>("volume_method");
 *   int threads = config.get<int>("threads", 0);
 */
class ConfigManager {
public:
    ConfigManager(const std::string& module, const json& defaults, const json& user_input);

    /*! \brief Type-safe parameter access, throws std::runtime_error on missing key or wrong type */
    template <typename T>
    T get(const std::string& key) const;

    /*! \brief Type-safe parameter access with default value */
    template <typename T>
    T get(const std::string& key, T default_value) const;

    bool has(const std::string& key) const;

    json exportConfig() const { return m_config; }

    std::string getModule() const { return m_module; }

private:
    std::string m_module;
    json m_config;

    /*! \brief Case-insensitive key lookup, throws std::out_of_range */
    const json& findKey(const std::string& key) const;
};

template <typename T>
T ConfigManager::get(const std::string& key) const
{
    try {
        return findKey(key).get<T>();
    } catch (const std::out_of_range&) {
        throw std::runtime_error("ConfigManager: Parameter '" + key + "' not found in module '" + m_module + "'");
    } catch (const json::exception& e) {
        throw std::runtime_error("ConfigManager: Parameter '" + key + "' in module '" + m_module + "' has wrong type: " + e.what());
    }
}

template <typename T>
T ConfigManager::get(const std::string& key, T default_value) const
{
    if (!has(key))
        return default_value;
    return get<T>(key);
}
