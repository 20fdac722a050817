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

#include "radius_lookup.h"

#include "src/core/clusterlens_logger.h"
#include "src/core/global.h"
#include "src/core/ionic_radii.h"
#include "src/core/reference_data.h"

namespace ClusterLens {

std::string RadiusSourceName(RadiusSource source)
{
    switch (source) {
    case RadiusSource::Ionic:
        return "ionic";
    case RadiusSource::Covalent:
        return "covalent";
    default:
        return "absent";
    }
}

RadiusLookup RadiusLookup::Build(const FormalChargeTable& charges, const ReferenceDataProvider& reference)
{
    RadiusLookup lookup;
    for (const auto& [element, formal] : charges) {
        const std::string label = IonicRadii::RomanNumeral(formal.coordination);
        if (label.empty()) {
            ClusterLensLogger::warn_fmt("Coordination number {} of {} is outside I-XV, no radius entry", formal.coordination, element);
            continue;
        }

        RadiusLookupEntry entry;
        entry.element = element;
        entry.charge = formal.charge;

        if (auto ionic = reference.IonicRadius(element, formal.charge, label)) {
            entry.source = RadiusSource::Ionic;
            entry.radius = *ionic;
        } else if (auto covalent = reference.CovalentRadius(element)) {
            entry.source = RadiusSource::Covalent;
            entry.radius = *covalent;
            ClusterLensLogger::info_fmt("No ionic radius for {}{:+d} ({}), using covalent radius {:.3f} Å", element, formal.charge, label, *covalent);
        } else {
            entry.source = RadiusSource::Absent;
            ClusterLensLogger::warn_fmt("Neither ionic nor covalent radius for {}{:+d}", element, formal.charge);
        }

        if (entry.radius)
            entry.volume = SphereVolume(*entry.radius);

        lookup.m_entries[{ element, formal.charge }] = entry;
    }
    return lookup;
}

const RadiusLookupEntry* RadiusLookup::Find(const std::string& element, int charge) const
{
    auto it = m_entries.find({ element, charge });
    if (it == m_entries.end())
        return nullptr;
    return &it->second;
}

json RadiusLookup::toJson() const
{
    json result = json::array();
    for (const auto& [key, entry] : m_entries) {
        json item;
        item["element"] = entry.element;
        item["charge"] = entry.charge;
        item["source"] = RadiusSourceName(entry.source);
        item["radius"] = entry.radius ? json(*entry.radius) : json(nullptr);
        item["volume"] = entry.volume ? json(*entry.volume) : json(nullptr);
        result.push_back(item);
    }
    return result;
}
}
