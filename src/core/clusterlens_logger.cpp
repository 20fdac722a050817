/*
 * <ClusterLens Logging System Implementation>
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

#include "clusterlens_logger.h"

#include <algorithm>
#include <cstdlib>
#include <unistd.h>

int ClusterLensLogger::m_verbosity = 1;
bool ClusterLensLogger::m_use_colors = true;
ClusterLensLogger::OutputFormat ClusterLensLogger::m_format = ClusterLensLogger::OutputFormat::TERMINAL;
std::chrono::high_resolution_clock::time_point ClusterLensLogger::m_start_time;
std::mutex ClusterLensLogger::m_print_mutex;

void ClusterLensLogger::initialize(int verbosity, bool auto_detect_colors)
{
    m_verbosity = verbosity;

    if (auto_detect_colors)
        m_use_colors = isatty(STDOUT_FILENO) && (std::getenv("CLUSTERLENS_NO_COLOR") == nullptr);
    else
        m_use_colors = false;

    m_format = OutputFormat::TERMINAL;
    m_start_time = std::chrono::high_resolution_clock::now();
}

void ClusterLensLogger::error(const std::string& msg)
{
    // Errors always visible
    log_colored(fmt::color::red, "[ERROR] ", msg);
}

void ClusterLensLogger::warn(const std::string& msg)
{
    if (m_verbosity >= 1)
        log_colored(fmt::color::orange, "[WARN]  ", msg);
}

void ClusterLensLogger::success(const std::string& msg)
{
    if (m_verbosity >= 1)
        log_colored(fmt::color::lime_green, "[OK]    ", msg);
}

void ClusterLensLogger::info(const std::string& msg)
{
    if (m_verbosity >= 2)
        log_plain("        " + msg);
}

void ClusterLensLogger::verbose(const std::string& msg)
{
    if (m_verbosity >= 3)
        log_colored(fmt::color::gray, "[INFO]  ", msg);
}

void ClusterLensLogger::param(const std::string& key, const std::string& value)
{
    if (m_verbosity >= 2)
        log_colored(fmt::color::cornflower_blue, "[PARAM] ", key + ": " + value);
}

void ClusterLensLogger::param(const std::string& key, int value)
{
    if (m_verbosity >= 2)
        log_colored(fmt::color::cornflower_blue, "[PARAM] ", key + ": " + std::to_string(value));
}

void ClusterLensLogger::param(const std::string& key, double value)
{
    if (m_verbosity >= 2)
        log_colored(fmt::color::cornflower_blue, "[PARAM] ", fmt::format("{}: {:.6g}", key, value));
}

void ClusterLensLogger::param(const std::string& key, bool value)
{
    if (m_verbosity >= 2)
        log_colored(fmt::color::cornflower_blue, "[PARAM] ", key + ": " + (value ? "true" : "false"));
}

void ClusterLensLogger::param_table(const json& parameters, const std::string& title)
{
    if (m_verbosity < 1 || parameters.empty())
        return;

    log_colored(fmt::color::cyan, "[TABLE] ", title);
    log_plain("        " + std::string(title.length() + 8, '-'));

    size_t max_key_length = 0;
    for (const auto& item : parameters.items())
        max_key_length = std::max(max_key_length, item.key().length());

    for (const auto& item : parameters.items()) {
        std::string padded_key = item.key();
        padded_key.resize(max_key_length, ' ');
        log_colored(fmt::color::cornflower_blue, "        ", padded_key + " : " + format_json_value(item.value()));
    }
    log_plain("");
}

void ClusterLensLogger::result_raw(const std::string& data)
{
    // Raw results for scripting - no colors, no prefix
    std::lock_guard<std::mutex> lock(m_print_mutex);
    fmt::print("{}\n", data);
}

void ClusterLensLogger::header(const std::string& title)
{
    if (m_verbosity >= 2) {
        std::string separator(title.length() + 4, '=');
        log_colored(fmt::color::cyan, "", separator);
        log_colored(fmt::color::cyan, "", "  " + title);
        log_colored(fmt::color::cyan, "", separator);
    }
}

void ClusterLensLogger::log_colored(fmt::color color, const std::string& prefix, const std::string& msg, bool force_plain)
{
    std::lock_guard<std::mutex> lock(m_print_mutex);
    if (m_use_colors && !force_plain && m_format == OutputFormat::TERMINAL) {
        fmt::print(fmt::fg(color), "{}{}\n", prefix, msg);
    } else {
        fmt::print("{}{}\n", prefix, msg);
    }
}

void ClusterLensLogger::log_plain(const std::string& msg)
{
    std::lock_guard<std::mutex> lock(m_print_mutex);
    fmt::print("{}\n", msg);
}

std::string ClusterLensLogger::format_json_value(const json& value)
{
    if (value.is_string()) {
        return value.get<std::string>();
    } else if (value.is_number_integer()) {
        return std::to_string(value.get<int>());
    } else if (value.is_number_float()) {
        return fmt::format("{:.6g}", value.get<double>());
    } else if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    } else if (value.is_array()) {
        return value.size() <= 4 ? value.dump() : fmt::format("[{} items]", value.size());
    } else if (value.is_object()) {
        return fmt::format("{{{} keys}}", value.size());
    }
    return value.dump();
}
