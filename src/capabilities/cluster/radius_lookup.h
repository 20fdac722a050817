/*
 * <Radius and sphere volume per element and formal charge>
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

#include "cluster_config.h"

#include <map>
#include <optional>
#include <string>
#include <utility>

class ReferenceDataProvider;

namespace ClusterLens {

enum class RadiusSource {
    Ionic,
    Covalent,
    Absent
};

std::string RadiusSourceName(RadiusSource source);

/*! \brief Radius in Angstrom and sphere volume in Angstrom^3, both empty if source is Absent */
struct RadiusLookupEntry {
    std::string element;
    int charge = 0;
    RadiusSource source = RadiusSource::Absent;
    std::optional<double> radius;
    std::optional<double> volume;
};

/*! \brief (element, formal charge) -> radius, built once before any file is processed
 *
 * For every FormalChargeTable entry the coordination number is turned into its
 * Roman numeral label and an ionic radius with exactly this charge and label is
 * looked up. Without a match the covalent radius is used, without that the
 * entry is kept as Absent. Coordination numbers outside I..XV give no entry.
 * Read-only after Build, shared by all worker threads.
 */
class RadiusLookup {
public:
    static RadiusLookup Build(const FormalChargeTable& charges, const ReferenceDataProvider& reference);

    /* nullptr if no entry exists for the key */
    const RadiusLookupEntry* Find(const std::string& element, int charge) const;

    std::size_t Size() const { return m_entries.size(); }
    bool Empty() const { return m_entries.empty(); }

    const std::map<std::pair<std::string, int>, RadiusLookupEntry>& Entries() const { return m_entries; }

    json toJson() const;

private:
    std::map<std::pair<std::string, int>, RadiusLookupEntry> m_entries;
};
}
