#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <string>
#include <map>
#include <vector>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace TuberSim {

/**
 * @brief Unit definition with conversion to the model unit of its quantity
 *
 * The model does not work in SI base units. Each quantity has a model
 * unit matching the engine's parameter records:
 * - temperature: degC
 * - power: W
 * - energy: kJ
 * - heat rate: kJ/day
 * - heat capacity: kJ/K
 * - heat transfer coefficient: kJ/day/K
 * - mass: g
 * - area: m2
 * - time: day
 * - photon flux: umol/m2/s
 * - light integral: mol/m2/day
 * - concentration: ppm
 * - thermal time: degC-day
 * - specific leaf area: m2/g
 * - light-use efficiency: g/MJ
 *
 * Power and heat rate are the same physical quantity in different
 * model units (1 W = 86.4 kJ/day); conversions between them are allowed.
 */
struct Unit {
    std::string name;           // Full name (e.g., "kilowatt hour")
    std::string symbol;         // Short symbol (e.g., "kWh")
    std::string quantity;       // Quantity kind; units convert only within one quantity
    double to_base;             // Conversion factor to the model unit
    double offset;              // Offset for affine conversions (temperature)
    std::vector<std::string> aliases;

    Unit() : to_base(1.0), offset(0.0) {}

    Unit(const std::string& n, const std::string& s,
         const std::string& q, double factor, double off = 0.0)
        : name(n), symbol(s), quantity(q), to_base(factor), offset(off) {}

    // Convert value from this unit to the model unit
    double convertToBase(double value) const {
        return (value + offset) * to_base;
    }

    // Convert value from the model unit to this unit
    double convertFromBase(double value) const {
        return value / to_base - offset;
    }
};

/**
 * @brief Unit database for configuration input and report output
 *
 * Provides:
 * - Database of the units used for chamber and crop quantities
 * - Conversion between units of the same quantity
 * - Parsing of value strings with units (e.g., "400 W", "20 degC", "25 MJ/day")
 */
class UnitSystem {
public:
    UnitSystem();
    ~UnitSystem() = default;

    // =========================================================================
    // Database Access
    // =========================================================================

    /**
     * @brief Get unit by name, symbol or alias
     * @return Pointer to Unit, or nullptr if not found
     */
    const Unit* getUnit(const std::string& name_or_symbol) const;

    bool hasUnit(const std::string& name_or_symbol) const;

    /**
     * @brief Get all units measuring a quantity
     * @param quantity Quantity name (e.g., "energy", "temperature")
     */
    std::vector<const Unit*> getUnitsInCategory(const std::string& quantity) const;

    // Model unit symbol for a quantity, empty if unknown
    std::string getBaseUnit(const std::string& quantity) const;

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Convert value between two units
     * @throws std::runtime_error if a unit is unknown or the quantities
     *         differ and are not equivalent
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    /**
     * @brief Convert value to the model unit of its quantity
     * @throws std::runtime_error if the unit is unknown
     */
    double toBase(double value, const std::string& from_unit) const;

    // =========================================================================
    // Parsing Functions
    // =========================================================================

    /**
     * @brief Split a value string into number and unit (e.g., "1.2 kJ/K")
     * @param[out] value Parsed number, not converted
     * @param[out] unit Unit string, empty if none was given
     * @return true if a number was found
     */
    bool parseValueWithUnit(const std::string& value_with_unit,
                            double& value, std::string& unit) const;

    /**
     * @brief Parse value with unit and convert to the model unit
     * @throws std::runtime_error on parse or unit errors
     */
    double parseAndConvertToBase(const std::string& value_with_unit) const;

    // =========================================================================
    // Quantity checks
    // =========================================================================

    bool areCompatible(const std::string& unit1, const std::string& unit2) const;

    // =========================================================================
    // Custom Unit Registration
    // =========================================================================

    void addUnit(const Unit& unit);
    void addAlias(const std::string& unit_name, const std::string& alias);

    // =========================================================================
    // Utility Functions
    // =========================================================================

    // List every quantity with its model unit and registered units
    void printDatabase(std::ostream& os) const;

private:
    // Unit database: maps name/symbol/alias -> Unit
    std::map<std::string, Unit> units_;

    // Quantity index: quantity -> list of unit names
    std::map<std::string, std::vector<std::string>> categories_;

    // Model unit per quantity
    std::map<std::string, std::string> base_units_;

    // (from quantity, to quantity) -> factor between their model units
    std::map<std::pair<std::string, std::string>, double> equivalences_;

    void initializeDatabase();

    void addTemperatureUnits();
    void addPowerUnits();
    void addEnergyUnits();
    void addHeatRateUnits();
    void addHeatCapacityUnits();
    void addHeatTransferUnits();
    void addMassUnits();
    void addAreaUnits();
    void addTimeUnits();
    void addLightUnits();
    void addConcentrationUnits();
    void addCropUnits();

    void registerUnit(const Unit& unit);
    void addEquivalence(const std::string& quantity1, const std::string& quantity2,
                        double factor);

    std::string toLowerCase(const std::string& str) const;
    std::string trim(const std::string& str) const;
};

} // namespace TuberSim

#endif // UNIT_SYSTEM_HPP
