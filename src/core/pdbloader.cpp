/*
 * <PDB reader for solvated clusters>
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

#include "pdbloader.h"

#include "src/core/clusterlens_logger.h"
#include "src/core/elements.h"
#include "src/core/errors.h"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace {
std::string trimmed(const std::string& string)
{
    auto begin = std::find_if_not(string.begin(), string.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(string.rbegin(), string.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (begin >= end)
        return "";
    return std::string(begin, end);
}

std::string upper(std::string string)
{
    std::transform(string.begin(), string.end(), string.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return string;
}

/* columns are 1-based and inclusive as in the PDB format description */
std::string column(const std::string& line, std::size_t first, std::size_t last)
{
    if (line.size() < first)
        return "";
    return line.substr(first - 1, std::min(last, line.size()) - first + 1);
}

bool contains(const StringList& list, const std::string& residue)
{
    for (const auto& entry : list) {
        if (upper(trimmed(entry)) == residue)
            return true;
    }
    return false;
}
}

PDBStructureLoader::PDBStructureLoader(const StringList& core_residues, const StringList& shell_residues)
    : m_core_residues(core_residues)
    , m_shell_residues(shell_residues)
{
}

std::string PDBStructureLoader::ElementFromAtomName(const std::string& name) const
{
    // two letter elements start in column 13, one letter elements in column 14
    std::string letters;
    for (char c : name) {
        if (std::isalpha(static_cast<unsigned char>(c)))
            letters.push_back(c);
        else if (!letters.empty())
            break;
    }
    if (letters.empty())
        return "";

    if (!name.empty() && !std::isspace(static_cast<unsigned char>(name[0])) && letters.size() >= 2) {
        int element = Elements::String2Element(letters.substr(0, 2));
        if (element)
            return Elements::Element2String(element);
    }
    int element = Elements::String2Element(letters.substr(0, 1));
    if (element)
        return Elements::Element2String(element);
    return "";
}

bool PDBStructureLoader::ParseLine(const std::string& line, Atom& atom, std::string& residue) const
{
    const std::string record = trimmed(column(line, 1, 6));
    if (record != "ATOM" && record != "HETATM")
        return false;

    if (line.size() < 54)
        throw StructureLoadError("Truncated atom record: " + line);

    residue = upper(trimmed(column(line, 18, 20)));

    try {
        atom.position = Position(std::stod(column(line, 31, 38)), std::stod(column(line, 39, 46)), std::stod(column(line, 47, 54)));
    } catch (const std::logic_error&) {
        throw StructureLoadError("Invalid coordinates in atom record: " + line);
    }

    std::string element = trimmed(column(line, 77, 78));
    element.erase(std::remove_if(element.begin(), element.end(), [](unsigned char c) { return std::isdigit(c) != 0; }), element.end());
    int Z = Elements::String2Element(element);
    if (Z)
        atom.element = Elements::Element2String(Z);
    else
        atom.element = ElementFromAtomName(column(line, 13, 16));

    if (atom.element.empty())
        throw StructureLoadError("No element in atom record: " + line);
    return true;
}

ClusterStructure PDBStructureLoader::Load(const std::string& file) const
{
    std::ifstream input(file);
    if (!input.is_open())
        throw StructureLoadError("Could not open " + file);

    ClusterStructure structure;
    int ignored = 0;
    for (std::string line; std::getline(input, line);) {
        Atom atom;
        std::string residue;
        if (!ParseLine(line, atom, residue))
            continue;

        if (contains(m_core_residues, residue)) {
            atom.group = AtomGroup::Core;
            structure.core.push_back(atom);
        } else if (contains(m_shell_residues, residue)) {
            atom.group = AtomGroup::Shell;
            structure.shell.push_back(atom);
        } else
            ++ignored;
    }
    ClusterLensLogger::verbose_fmt("{}: {} core, {} shell, {} ignored atoms", file, structure.core.size(), structure.shell.size(), ignored);
    return structure;
}
