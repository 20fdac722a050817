/*
 * <Configuration of cluster measurements>
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

#include "cluster_config.h"

#include "src/core/config_manager.h"
#include "src/core/elements.h"
#include "src/core/errors.h"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace ClusterLens {

namespace {
std::string lower(std::string string)
{
    std::transform(string.begin(), string.end(), string.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return string;
}

/* canonical symbol ("PB" -> "Pb"), unknown symbols are a configuration error */
std::string CanonicalElement(const std::string& element)
{
    int Z = Elements::String2Element(element);
    if (Z == 0)
        throw UnknownConfiguration("Unknown element symbol '" + element + "'");
    return Elements::Element2String(Z);
}

StringList CanonicalElements(const StringList& elements)
{
    StringList result;
    for (const auto& element : elements) {
        std::string symbol = CanonicalElement(element);
        if (std::find(result.begin(), result.end(), symbol) == result.end())
            result.push_back(symbol);
    }
    return result;
}

/* formal charges and coordination numbers are whole numbers, 2.0 is accepted, 0.5 is not */
int IntegerValue(const json& value, const std::string& element, const std::string& what)
{
    if (value.is_number_integer())
        return value.get<int>();
    if (value.is_number_float()) {
        const double number = value.get<double>();
        if (std::floor(number) == number)
            return static_cast<int>(number);
        throw UnknownConfiguration(fmt::format("Formal {} of {} must be an integer, got {}", what, element, number));
    }
    throw UnknownConfiguration(fmt::format("Formal {} of {} must be a number", what, element));
}

const std::map<std::string, VolumeMethod> MethodNames = {
    { "ionic_radius", VolumeMethod::IonicRadius },
    { "radius_of_gyration", VolumeMethod::RadiusOfGyration },
    { "convex_hull", VolumeMethod::ConvexHull },
    { "coherent_scattering", VolumeMethod::CoherentScattering },
    { "outward_facing", VolumeMethod::OutwardFacing }
};
}

bool ClusterSettings::IsTarget(const std::string& element) const
{
    return std::find(target_elements.begin(), target_elements.end(), element) != target_elements.end();
}

bool ClusterSettings::IsNeighbor(const std::string& element) const
{
    return std::find(neighbor_elements.begin(), neighbor_elements.end(), element) != neighbor_elements.end();
}

int ClusterSettings::Charge(const std::string& element) const
{
    auto it = charges.find(element);
    if (it == charges.end())
        return 0;
    return it->second.charge;
}

VolumeMethod ParseVolumeMethod(const std::string& name)
{
    auto it = MethodNames.find(lower(name));
    if (it == MethodNames.end())
        throw UnknownConfiguration("Unknown volume method: " + name);
    return it->second;
}

std::string VolumeMethodName(VolumeMethod method)
{
    for (const auto& [name, value] : MethodNames)
        if (value == method)
            return name;
    return "";
}

RgShape ParseShape(const std::string& name)
{
    const std::string shape = lower(name);
    if (shape == "sphere")
        return RgShape::Sphere;
    else if (shape == "ellipsoid")
        return RgShape::Ellipsoid;
    throw UnknownConfiguration("Unknown shape type: " + name);
}

std::string ShapeName(RgShape shape)
{
    return shape == RgShape::Sphere ? "sphere" : "ellipsoid";
}

FormalChargeTable ParseCharges(const json& charges)
{
    FormalChargeTable table;
    if (charges.is_null())
        return table;
    if (!charges.is_object())
        throw UnknownConfiguration("charges must map element symbols to [charge, coordination]");

    for (const auto& item : charges.items()) {
        const json& value = item.value();
        FormalCharge entry;
        try {
            if (value.is_array() && value.size() == 2) {
                entry.charge = IntegerValue(value[0], item.key(), "charge");
                entry.coordination = IntegerValue(value[1], item.key(), "coordination");
            } else if (value.is_object()) {
                entry.charge = IntegerValue(value.at("charge"), item.key(), "charge");
                entry.coordination = IntegerValue(value.at("coordination"), item.key(), "coordination");
            } else
                throw UnknownConfiguration(fmt::format("charges entry for {} must be [charge, coordination]", item.key()));
        } catch (const json::exception& e) {
            throw UnknownConfiguration(fmt::format("Invalid charges entry for {}: {}", item.key(), e.what()));
        }
        table[CanonicalElement(item.key())] = entry;
    }
    return table;
}

ThresholdMap ParseThresholds(const json& thresholds)
{
    ThresholdMap map;
    if (thresholds.is_null())
        return map;
    if (!thresholds.is_object())
        throw UnknownConfiguration("distance_thresholds must map target elements to {neighbor: distance}");

    for (const auto& target : thresholds.items()) {
        if (!target.value().is_object())
            throw UnknownConfiguration("distance_thresholds entry for " + target.key() + " must be an object");
        const std::string target_element = CanonicalElement(target.key());
        for (const auto& neighbor : target.value().items()) {
            if (!neighbor.value().is_number())
                throw UnknownConfiguration(fmt::format("Threshold {}-{} is not a number", target.key(), neighbor.key()));
            double distance = neighbor.value().get<double>();
            if (distance < 0)
                throw UnknownConfiguration(fmt::format("Threshold {}-{} is negative", target.key(), neighbor.key()));
            map[target_element][CanonicalElement(neighbor.key())] = distance;
        }
    }
    return map;
}

ClusterSettings ParseClusterSettings(const ConfigManager& config)
{
    ClusterSettings settings;
    try {
        settings.target_elements = CanonicalElements(Json2StringList(config.get<json>("target_elements")));
        settings.neighbor_elements = CanonicalElements(Json2StringList(config.get<json>("neighbor_elements", json::array())));
        settings.thresholds = ParseThresholds(config.get<json>("distance_thresholds", json::object()));
        settings.charges = ParseCharges(config.get<json>("charges", json::object()));

        settings.volume.method = ParseVolumeMethod(config.get<std::string>("volume_method"));
        settings.volume.shape = ParseShape(config.get<std::string>("shape", "sphere"));
        settings.volume.energy = config.get<double>("energy", 17000.0);
    } catch (const UnknownConfiguration&) {
        throw;
    } catch (const json::exception& e) {
        throw UnknownConfiguration(e.what());
    } catch (const std::runtime_error& e) {
        throw UnknownConfiguration(e.what());
    }

    if (settings.target_elements.empty())
        throw UnknownConfiguration("No target elements given");
    if (settings.volume.energy <= 0)
        throw UnknownConfiguration(fmt::format("Photon energy must be positive, got {} eV", settings.volume.energy));

    return settings;
}
}
