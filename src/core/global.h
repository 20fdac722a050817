/*
 * <Some global definitions for cluster structures.>
 * Copyright (C) 2019 - 2025 Conrad Hübler <Conrad.Huebler@gmx.net>
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
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <Eigen/Dense>

#include <nlohmann/json.hpp>

// for convenience
using json = nlohmann::json;

const double pi = 3.14159265358979323846;
const double avogadro = 6.02214076e23; // 1/mol

typedef Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> Geometry;
typedef Eigen::Vector3d Position;

typedef Eigen::VectorXd Vector;
typedef std::vector<std::string> StringList;

inline double SphereVolume(double radius)
{
    return 4.0 / 3.0 * pi * radius * radius * radius;
}

inline json MergeJson(const json& reference, const json& patch)
{
    json result = reference;
    for (const auto& object : patch.items()) {
        bool found = false;
        std::string outer = object.key();
        std::transform(outer.begin(), outer.end(), outer.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        for (const auto& local : reference.items()) {
            std::string inner = local.key();
            std::transform(inner.begin(), inner.end(), inner.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (outer.compare(inner) == 0) {
                result[local.key()] = object.value();
                found = true;
            }
        }
        if (!found) {
            result[outer] = object.value();
        }
    }
    return result;
}

/* -keyword is the capability, every following -key value pair ends up in controller[keyword] */
inline json CLI2Json(int argc, char** argv)
{
    json controller;
    json key = json::object();
    if (argc < 2)
        return controller;
    std::string keyword = argv[1];
    keyword.erase(0, 1);
    for (int i = 2; i < argc; ++i) {
        std::string current = argv[i];
        std::string sub = current.substr(0, 1);
        if (sub.compare("-") != 0)
            continue;
        current.erase(0, 1);

        if (current == "silent" || current == "quiet") {
            key["verbosity"] = 0;
            continue;
        } else if (current == "verbose") {
            key["verbosity"] = 3;
            continue;
        }

        if ((i + 1) >= argc) {
            key[current] = true;
            continue;
        }
        std::string next = argv[i + 1];
        std::string next_sub = next.substr(0, 1);
        if (next_sub.compare("-") == 0 && next.size() > 1 && !std::isdigit(static_cast<unsigned char>(next[1]))) {
            key[current] = true;
            continue;
        }
        if (next.compare("false") == 0) {
            key[current] = false;
        } else if (next.compare("true") == 0) {
            key[current] = true;
        } else if (next.find(",") != std::string::npos) {
            key[current] = next;
        } else {
            try {
                std::size_t consumed = 0;
                double number = std::stod(next, &consumed);
                if (consumed == next.size())
                    key[current] = number;
                else
                    key[current] = next;
            } catch (const std::logic_error&) {
                key[current] = next;
            }
        }
        ++i;
    }
    controller[keyword] = key;
    return controller;
}

/* "Pb,I" -> {"Pb", "I"}; json arrays are accepted as well */
inline StringList Json2StringList(const json& value)
{
    StringList list;
    if (value.is_array()) {
        for (const auto& entry : value)
            list.push_back(entry.get<std::string>());
    } else if (value.is_string()) {
        std::string string = value.get<std::string>();
        std::size_t start = 0;
        while (start <= string.size()) {
            std::size_t end = string.find(',', start);
            if (end == std::string::npos)
                end = string.size();
            std::string item = string.substr(start, end - start);
            item.erase(std::remove_if(item.begin(), item.end(), [](unsigned char c) { return std::isspace(c) != 0; }), item.end());
            if (!item.empty())
                list.push_back(item);
            start = end + 1;
        }
    }
    return list;
}

inline json LoadJsonFile(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
        throw std::runtime_error("Could not open " + filename);
    json content;
    file >> content;
    return content;
}

/* CPU bound work keeps one core for the main thread, IO bound work oversubscribes */
inline int SafeThreadCount(const std::string& task_type = "cpu", int max_factor = 2)
{
    int cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cores < 1)
        cores = 1;

    if (task_type == "cpu")
        return std::max(1, cores - 1);
    else if (task_type == "io")
        return std::max(1, cores * max_factor);

    throw std::invalid_argument("task_type must be 'cpu' or 'io'");
}
