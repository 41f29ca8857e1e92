#include "UnitSystem.hpp"
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace TuberSim {

UnitSystem::UnitSystem() {
    initializeDatabase();
}

void UnitSystem::initializeDatabase() {
    addTemperatureUnits();
    addPowerUnits();
    addEnergyUnits();
    addHeatRateUnits();
    addHeatCapacityUnits();
    addHeatTransferUnits();
    addMassUnits();
    addAreaUnits();
    addTimeUnits();
    addLightUnits();
    addConcentrationUnits();
    addCropUnits();

    base_units_["temperature"] = "degC";
    base_units_["power"] = "W";
    base_units_["energy"] = "kJ";
    base_units_["heat_rate"] = "kJ/day";
    base_units_["heat_capacity"] = "kJ/K";
    base_units_["heat_transfer"] = "kJ/day/K";
    base_units_["mass"] = "g";
    base_units_["area"] = "m2";
    base_units_["time"] = "day";
    base_units_["photon_flux"] = "umol/m2/s";
    base_units_["light_integral"] = "mol/m2/day";
    base_units_["concentration"] = "ppm";
    base_units_["thermal_time"] = "degC-day";
    base_units_["specific_leaf_area"] = "m2/g";
    base_units_["light_use_efficiency"] = "g/MJ";

    // 1 W sustained for a day = 86400 J = 86.4 kJ
    addEquivalence("power", "heat_rate", 86.4);
}

// =============================================================================
// Temperature Units
// =============================================================================

void UnitSystem::addTemperatureUnits() {
    registerUnit(Unit("celsius", "degC", "temperature", 1.0));
    registerUnit(Unit("kelvin", "K", "temperature", 1.0, -273.15));
    registerUnit(Unit("fahrenheit", "degF", "temperature", 5.0 / 9.0, -32.0));
}

// =============================================================================
// Electrical / Thermal Units
// =============================================================================

void UnitSystem::addPowerUnits() {
    registerUnit(Unit("watt", "W", "power", 1.0));
    registerUnit(Unit("kilowatt", "kW", "power", 1000.0));
}

void UnitSystem::addEnergyUnits() {
    registerUnit(Unit("kilojoule", "kJ", "energy", 1.0));
    registerUnit(Unit("joule", "J", "energy", 1e-3));
    registerUnit(Unit("megajoule", "MJ", "energy", 1000.0));
    registerUnit(Unit("watt hour", "Wh", "energy", 3.6));
    registerUnit(Unit("kilowatt hour", "kWh", "energy", 3600.0));
}

void UnitSystem::addHeatRateUnits() {
    registerUnit(Unit("kilojoule per day", "kJ/day", "heat_rate", 1.0));
    registerUnit(Unit("megajoule per day", "MJ/day", "heat_rate", 1000.0));
    registerUnit(Unit("kilojoule per hour", "kJ/h", "heat_rate", 24.0));
    registerUnit(Unit("kilowatt hour per day", "kWh/day", "heat_rate", 3600.0));
}

void UnitSystem::addHeatCapacityUnits() {
    Unit kj_per_k("kilojoule per kelvin", "kJ/K", "heat_capacity", 1.0);
    kj_per_k.aliases.push_back("kJ/degC");
    registerUnit(kj_per_k);
    registerUnit(Unit("joule per kelvin", "J/K", "heat_capacity", 1e-3));
    registerUnit(Unit("megajoule per kelvin", "MJ/K", "heat_capacity", 1000.0));
}

void UnitSystem::addHeatTransferUnits() {
    Unit kj_day_k("kilojoule per day kelvin", "kJ/day/K", "heat_transfer", 1.0);
    kj_day_k.aliases.push_back("kJ/(day-K)");
    registerUnit(kj_day_k);
    // 1 W/K = 86.4 kJ/day/K
    registerUnit(Unit("watt per kelvin", "W/K", "heat_transfer", 86.4));
    registerUnit(Unit("kilojoule per hour kelvin", "kJ/h/K", "heat_transfer", 24.0));
}

// =============================================================================
// Crop Quantities
// =============================================================================

void UnitSystem::addMassUnits() {
    registerUnit(Unit("gram", "g", "mass", 1.0));
    registerUnit(Unit("kilogram", "kg", "mass", 1000.0));
    registerUnit(Unit("milligram", "mg", "mass", 1e-3));
}

void UnitSystem::addAreaUnits() {
    registerUnit(Unit("square meter", "m2", "area", 1.0));
    registerUnit(Unit("square centimeter", "cm2", "area", 1e-4));
    registerUnit(Unit("square foot", "ft2", "area", 0.09290304));
}

void UnitSystem::addTimeUnits() {
    Unit day("day", "day", "time", 1.0);
    day.aliases.push_back("d");
    day.aliases.push_back("days");
    registerUnit(day);

    Unit hour("hour", "h", "time", 1.0 / 24.0);
    hour.aliases.push_back("hr");
    hour.aliases.push_back("hours");
    registerUnit(hour);

    registerUnit(Unit("week", "week", "time", 7.0));
}

void UnitSystem::addLightUnits() {
    Unit umol("micromole per square meter second", "umol/m2/s", "photon_flux", 1.0);
    umol.aliases.push_back("umol m-2 s-1");
    registerUnit(umol);
    registerUnit(Unit("mole per square meter second", "mol/m2/s", "photon_flux", 1e6));

    Unit dli("mole per square meter day", "mol/m2/day", "light_integral", 1.0);
    dli.aliases.push_back("mol/m2/d");
    registerUnit(dli);
}

void UnitSystem::addConcentrationUnits() {
    registerUnit(Unit("parts per million", "ppm", "concentration", 1.0));
    registerUnit(Unit("parts per billion", "ppb", "concentration", 1e-3));
    registerUnit(Unit("volume percent", "%", "concentration", 1e4));
}

void UnitSystem::addCropUnits() {
    Unit tt("degree celsius day", "degC-day", "thermal_time", 1.0);
    tt.aliases.push_back("degC-d");
    tt.aliases.push_back("K-day");
    registerUnit(tt);

    registerUnit(Unit("square meter per gram", "m2/g", "specific_leaf_area", 1.0));
    registerUnit(Unit("square centimeter per gram", "cm2/g", "specific_leaf_area", 1e-4));
    registerUnit(Unit("square meter per kilogram", "m2/kg", "specific_leaf_area", 1e-3));

    registerUnit(Unit("gram per megajoule", "g/MJ", "light_use_efficiency", 1.0));
    registerUnit(Unit("kilogram per megajoule", "kg/MJ", "light_use_efficiency", 1000.0));
}

// =============================================================================
// Helper Functions
// =============================================================================

void UnitSystem::registerUnit(const Unit& unit) {
    std::string key = toLowerCase(unit.name);
    units_[key] = unit;

    // Symbols are case-sensitive (mJ is not MJ); names and aliases also match lowercase
    if (!unit.symbol.empty()) {
        units_[unit.symbol] = unit;
    }

    for (const auto& alias : unit.aliases) {
        units_[alias] = unit;
        units_.insert({toLowerCase(alias), unit});
    }

    if (!unit.quantity.empty()) {
        auto& names = categories_[unit.quantity];
        if (std::find(names.begin(), names.end(), key) == names.end()) {
            names.push_back(key);
        }
    }
}

void UnitSystem::addEquivalence(const std::string& quantity1, const std::string& quantity2,
                                double factor) {
    equivalences_[{quantity1, quantity2}] = factor;
    equivalences_[{quantity2, quantity1}] = 1.0 / factor;
}

std::string UnitSystem::toLowerCase(const std::string& str) const {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string UnitSystem::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// =============================================================================
// Database Access
// =============================================================================

const Unit* UnitSystem::getUnit(const std::string& name_or_symbol) const {
    auto it = units_.find(name_or_symbol);
    if (it != units_.end()) {
        return &(it->second);
    }

    it = units_.find(toLowerCase(name_or_symbol));
    if (it != units_.end()) {
        return &(it->second);
    }

    return nullptr;
}

bool UnitSystem::hasUnit(const std::string& name_or_symbol) const {
    return getUnit(name_or_symbol) != nullptr;
}

std::vector<const Unit*> UnitSystem::getUnitsInCategory(const std::string& quantity) const {
    std::vector<const Unit*> result;
    auto it = categories_.find(quantity);
    if (it != categories_.end()) {
        for (const auto& unit_name : it->second) {
            auto unit_it = units_.find(unit_name);
            if (unit_it != units_.end()) {
                result.push_back(&(unit_it->second));
            }
        }
    }
    return result;
}

std::string UnitSystem::getBaseUnit(const std::string& quantity) const {
    auto it = base_units_.find(quantity);
    if (it != base_units_.end()) {
        return it->second;
    }
    return "";
}

// =============================================================================
// Conversion Functions
// =============================================================================

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    const Unit* from = getUnit(from_unit);
    const Unit* to = getUnit(to_unit);

    if (!from) {
        throw std::runtime_error("Unknown source unit: " + from_unit);
    }
    if (!to) {
        throw std::runtime_error("Unknown destination unit: " + to_unit);
    }

    double factor = 1.0;
    if (from->quantity != to->quantity) {
        auto eq = equivalences_.find({from->quantity, to->quantity});
        if (eq == equivalences_.end()) {
            throw std::runtime_error("Incompatible units: " + from_unit + " (" + from->quantity +
                                     ") vs " + to_unit + " (" + to->quantity + ")");
        }
        factor = eq->second;
    }

    return to->convertFromBase(from->convertToBase(value) * factor);
}

double UnitSystem::toBase(double value, const std::string& from_unit) const {
    const Unit* unit = getUnit(from_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + from_unit);
    }
    return unit->convertToBase(value);
}

// =============================================================================
// Parsing Functions
// =============================================================================

bool UnitSystem::parseValueWithUnit(const std::string& value_with_unit,
                                    double& value, std::string& unit) const {
    std::string trimmed = trim(value_with_unit);
    if (trimmed.empty()) return false;

    size_t i = 0;
    if (trimmed[i] == '+' || trimmed[i] == '-') i++;

    bool has_digits = false;
    bool has_decimal = false;
    while (i < trimmed.length()) {
        if (std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
            has_digits = true;
            i++;
        } else if (trimmed[i] == '.' && !has_decimal) {
            has_decimal = true;
            i++;
        } else if ((trimmed[i] == 'e' || trimmed[i] == 'E') && has_digits &&
                   i + 1 < trimmed.length() &&
                   (std::isdigit(static_cast<unsigned char>(trimmed[i + 1])) ||
                    trimmed[i + 1] == '+' || trimmed[i + 1] == '-')) {
            // Exponent; a bare 'e' starts a unit instead
            i++;
            if (trimmed[i] == '+' || trimmed[i] == '-') {
                i++;
            }
        } else {
            break;
        }
    }

    if (!has_digits) return false;

    std::string num_str = trim(trimmed.substr(0, i));
    std::string unit_str = trim(trimmed.substr(i));

    try {
        value = std::stod(num_str);
    } catch (const std::exception&) {
        return false;
    }
    unit = unit_str;
    return true;
}

double UnitSystem::parseAndConvertToBase(const std::string& value_with_unit) const {
    double value;
    std::string unit;

    if (!parseValueWithUnit(value_with_unit, value, unit)) {
        throw std::runtime_error("Failed to parse: " + value_with_unit);
    }

    if (unit.empty()) {
        // Bare numbers are already in model units
        return value;
    }

    return toBase(value, unit);
}

bool UnitSystem::areCompatible(const std::string& unit1, const std::string& unit2) const {
    const Unit* u1 = getUnit(unit1);
    const Unit* u2 = getUnit(unit2);

    if (!u1 || !u2) return false;
    return u1->quantity == u2->quantity ||
           equivalences_.count({u1->quantity, u2->quantity}) > 0;
}

// =============================================================================
// Custom Units
// =============================================================================

void UnitSystem::addUnit(const Unit& unit) {
    registerUnit(unit);
}

void UnitSystem::addAlias(const std::string& unit_name, const std::string& alias) {
    const Unit* unit = getUnit(unit_name);
    if (unit) {
        Unit modified = *unit;
        modified.aliases.push_back(alias);
        registerUnit(modified);
    }
}

// =============================================================================
// Utility Functions
// =============================================================================

void UnitSystem::printDatabase(std::ostream& os) const {
    os << "Unit System Database\n";
    os << "====================\n\n";

    for (const auto& cat_pair : categories_) {
        os << "Quantity: " << cat_pair.first
           << " (model unit " << getBaseUnit(cat_pair.first) << ")\n";
        os << std::string(40, '-') << "\n";

        for (const auto& unit_name : cat_pair.second) {
            auto it = units_.find(unit_name);
            if (it != units_.end()) {
                const Unit& u = it->second;
                os << std::setw(35) << std::left << u.name
                   << " [" << std::setw(10) << u.symbol << "] "
                   << " = " << u.to_base << " * model unit\n";
            }
        }
        os << "\n";
    }
}

} // namespace TuberSim
