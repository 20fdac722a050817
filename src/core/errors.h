/*
 * <Exception types for cluster analysis>
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

#include <stdexcept>
#include <string>

/*! \brief A radius, oxidation state, cross-section or mass needed by a volume estimator is missing */
class MissingReferenceData : public std::runtime_error {
public:
    explicit MissingReferenceData(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

/*! \brief Unknown volume method, shape or otherwise invalid configuration, raised before any file is processed */
class UnknownConfiguration : public std::runtime_error {
public:
    explicit UnknownConfiguration(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

/*! \brief Structure file could not be read */
class StructureLoadError : public std::runtime_error {
public:
    explicit StructureLoadError(const std::string& what)
        : std::runtime_error(what)
    {
    }
};
