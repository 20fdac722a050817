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

#include "config_manager.h"

#include <cctype>

namespace {
std::string lower(std::string string)
{
    std::transform(string.begin(), string.end(), string.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return string;
}
}

ConfigManager::ConfigManager(const std::string& module, const json& defaults, const json& user_input)
    : m_module(module)
    , m_config(defaults.is_object() ? defaults : json::object())
{
    if (!user_input.is_object())
        return;

    for (const auto& item : user_input.items()) {
        const std::string user_key_lower = lower(item.key());

        bool found = false;
        for (const auto& def_item : m_config.items()) {
            if (user_key_lower == lower(def_item.key())) {
                m_config[def_item.key()] = item.value();
                found = true;
                break;
            }
        }

        if (!found)
            m_config[item.key()] = item.value();
    }
}

bool ConfigManager::has(const std::string& key) const
{
    const std::string key_lower = lower(key);
    for (const auto& item : m_config.items()) {
        if (lower(item.key()) == key_lower)
            return true;
    }
    return false;
}

const json& ConfigManager::findKey(const std::string& key) const
{
    const std::string key_lower = lower(key);
    for (auto it = m_config.begin(); it != m_config.end(); ++it) {
        if (lower(it.key()) == key_lower)
            return it.value();
    }
    throw std::out_of_range(key);
}
