#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "TuberSim.hpp"
#include "UnitSystem.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace TuberSim {

/**
 * @brief INI-style configuration reader
 *
 * Builds the three parameter records of a run from a single text file:
 *
 * @code
 *   [SCENARIO]
 *   days = 90
 *   ppfd = 350 umol/m2/s
 *   target_temperature = 18 degC
 *
 *   [CHAMBER]
 *   led_power = 0.4 kW
 *   cooling_capacity = 25 MJ/day
 * @endcode
 *
 * Values may carry a unit; they are converted to the unit of the
 * corresponding record field. Missing keys keep the record defaults.
 */
class ConfigReader {
public:
    struct OutputConfig {
        bool print_series;          // Print the daily table after the summary
        int series_stride;          // Print every n-th day

        OutputConfig() : print_series(false), series_stride(1) {}
    };

    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Parse configuration text already in memory
    bool loadString(const std::string& text);

    // =========================================================================
    // Record Parsing
    // =========================================================================

    bool parseScenario(ScenarioInput& scenario) const;
    bool parseGrowthParameters(GrowthParameters& growth) const;
    bool parseChamberParameters(ChamberParameters& chamber) const;
    bool parseOutputConfig(OutputConfig& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;

    /**
     * @brief Get double value converted to a target unit
     * @param section Config section
     * @param key Config key
     * @param default_val Default value (in target_unit)
     * @param target_unit Unit of the returned value; bare numbers are taken to be in it
     * @return Value in target_unit, or default_val on parse or unit errors
     */
    double getDoubleWithUnit(const std::string& section, const std::string& key,
                             double default_val, const std::string& target_unit) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    /**
     * @brief Check the parsed records for values the model cannot use
     *
     * Errors mark inputs that make a run meaningless (negative days,
     * non-positive area or heat capacity, photoperiod outside [0, 24],
     * negative light, CO2 or leaf mass). Warnings mark a zero-day run and
     * misordered cardinal temperatures, CO2 reference points and
     * phenology thresholds, which the model accepts but whose responses
     * are then undefined.
     */
    ValidationResult validate() const;

    // Check records directly, without a file
    static ValidationResult validate(const ScenarioInput& scenario,
                                     const GrowthParameters& growth,
                                     const ChamberParameters& chamber);

    // Write a commented configuration holding every default; false if the file cannot be created
    static bool generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    UnitSystem unit_system_;

    bool parseStream(std::istream& in);
    std::string trim(const std::string& str) const;
};

} // namespace TuberSim

#endif // CONFIG_READER_HPP
