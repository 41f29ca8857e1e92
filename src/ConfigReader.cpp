#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>

namespace TuberSim {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    return parseStream(file);
}

bool ConfigReader::loadString(const std::string& text) {
    std::istringstream in(text);
    return parseStream(in);
}

bool ConfigReader::parseStream(std::istream& in) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    // The whole value must be consumed: "1e2" and "90.7" are not integers
    std::size_t pos = 0;
    int result = default_val;
    try {
        result = std::stoi(val, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos > 0 && trim(val.substr(pos)).empty()) {
        return result;
    }

    std::cerr << "Warning: Cannot parse [" << section << "]:" << key
              << " = '" << val << "' as integer" << std::endl;
    return default_val;
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::size_t pos = 0;
    double result = default_val;
    try {
        result = std::stod(val, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos > 0 && trim(val.substr(pos)).empty()) {
        return result;
    }

    std::cerr << "Warning: Cannot parse [" << section << "]:" << key
              << " = '" << val << "' as double" << std::endl;
    return default_val;
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

double ConfigReader::getDoubleWithUnit(const std::string& section, const std::string& key,
                                       double default_val, const std::string& target_unit) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    double parsed_value;
    std::string parsed_unit;
    if (!unit_system_.parseValueWithUnit(val, parsed_value, parsed_unit)) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "'" << std::endl;
        return default_val;
    }

    if (parsed_unit.empty() || target_unit.empty()) {
        return parsed_value;
    }

    try {
        return unit_system_.convert(parsed_value, parsed_unit, target_unit);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Unit conversion error for [" << section
                  << "]:" << key << " - " << e.what() << std::endl;
        return default_val;
    }
}

// =============================================================================
// Record Parsing
// =============================================================================

bool ConfigReader::parseScenario(ScenarioInput& scenario) const {
    if (!hasSection("SCENARIO")) return false;

    const std::string s = "SCENARIO";
    scenario.days = getInt(s, "days", scenario.days);
    scenario.ppfd_umol_m2_s = getDoubleWithUnit(s, "ppfd", scenario.ppfd_umol_m2_s, "umol/m2/s");
    scenario.photoperiod_h = getDoubleWithUnit(s, "photoperiod", scenario.photoperiod_h, "h");
    scenario.co2_ppm = getDoubleWithUnit(s, "co2", scenario.co2_ppm, "ppm");
    scenario.target_chamber_temp_C = getDoubleWithUnit(s, "target_temperature",
                                                       scenario.target_chamber_temp_C, "degC");
    scenario.initial_leaf_dry_g = getDoubleWithUnit(s, "initial_leaf_dry_mass",
                                                    scenario.initial_leaf_dry_g, "g");
    scenario.ground_area_m2 = getDoubleWithUnit(s, "ground_area", scenario.ground_area_m2, "m2");
    return true;
}

bool ConfigReader::parseGrowthParameters(GrowthParameters& growth) const {
    if (!hasSection("GROWTH")) return false;

    const std::string s = "GROWTH";
    growth.LUE_dry_g_per_MJ = getDoubleWithUnit(s, "light_use_efficiency", growth.LUE_dry_g_per_MJ, "g/MJ");
    growth.frac_PAR = getDouble(s, "par_fraction", growth.frac_PAR);
    growth.SLA_m2_per_g_dry = getDoubleWithUnit(s, "specific_leaf_area", growth.SLA_m2_per_g_dry, "m2/g");
    growth.k_extinction = getDouble(s, "extinction_coefficient", growth.k_extinction);
    growth.dry_to_fresh_ratio = getDouble(s, "dry_to_fresh_ratio", growth.dry_to_fresh_ratio);

    growth.base_temp_C = getDoubleWithUnit(s, "base_temperature", growth.base_temp_C, "degC");
    growth.opt_temp_C = getDoubleWithUnit(s, "optimum_temperature", growth.opt_temp_C, "degC");
    growth.max_temp_C = getDoubleWithUnit(s, "max_temperature", growth.max_temp_C, "degC");

    growth.co2_ref_ppm = getDoubleWithUnit(s, "co2_reference", growth.co2_ref_ppm, "ppm");
    growth.co2_sat_ppm = getDoubleWithUnit(s, "co2_saturation", growth.co2_sat_ppm, "ppm");

    growth.tt_emergence = getDoubleWithUnit(s, "tt_emergence", growth.tt_emergence, "degC-day");
    growth.tt_tuber_init = getDoubleWithUnit(s, "tt_tuber_init", growth.tt_tuber_init, "degC-day");
    growth.tt_maturity = getDoubleWithUnit(s, "tt_maturity", growth.tt_maturity, "degC-day");

    growth.maint_frac_per_day = getDouble(s, "maintenance_fraction", growth.maint_frac_per_day);
    return true;
}

bool ConfigReader::parseChamberParameters(ChamberParameters& chamber) const {
    if (!hasSection("CHAMBER")) return false;

    const std::string s = "CHAMBER";
    chamber.heat_capacity_kJ_per_K = getDoubleWithUnit(s, "heat_capacity",
                                                       chamber.heat_capacity_kJ_per_K, "kJ/K");
    chamber.U_kJ_per_day_per_K = getDoubleWithUnit(s, "heat_loss_coefficient",
                                                   chamber.U_kJ_per_day_per_K, "kJ/day/K");
    chamber.led_power_W = getDoubleWithUnit(s, "led_power", chamber.led_power_W, "W");
    chamber.other_power_W = getDoubleWithUnit(s, "other_power", chamber.other_power_W, "W");
    chamber.cooling_capacity_kJ_per_day = getDoubleWithUnit(s, "cooling_capacity",
                                                            chamber.cooling_capacity_kJ_per_day, "kJ/day");
    chamber.ambient_temp_C = getDoubleWithUnit(s, "ambient_temperature", chamber.ambient_temp_C, "degC");
    return true;
}

bool ConfigReader::parseOutputConfig(OutputConfig& config) const {
    if (!hasSection("OUTPUT")) return false;

    config.print_series = getBool("OUTPUT", "print_series", config.print_series);
    config.series_stride = std::max(1, getInt("OUTPUT", "series_stride", config.series_stride));
    return true;
}

// =============================================================================
// Section/Key Query Methods
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Validation
// =============================================================================

ConfigReader::ValidationResult ConfigReader::validate() const {
    ScenarioInput scenario;
    GrowthParameters growth;
    ChamberParameters chamber;
    parseScenario(scenario);
    parseGrowthParameters(growth);
    parseChamberParameters(chamber);

    ValidationResult result = validate(scenario, growth, chamber);
    if (!hasSection("SCENARIO")) {
        result.warnings.push_back("No [SCENARIO] section; using default scenario");
    }
    return result;
}

ConfigReader::ValidationResult ConfigReader::validate(const ScenarioInput& scenario,
                                                      const GrowthParameters& growth,
                                                      const ChamberParameters& chamber) {
    ValidationResult result;
    result.valid = true;

    auto error = [&result](const std::string& msg) {
        result.errors.push_back(msg);
        result.valid = false;
    };

    if (scenario.days < 0) {
        error("SCENARIO.days must be non-negative");
    } else if (scenario.days == 0) {
        result.warnings.push_back("SCENARIO.days is 0; only the initial state is reported");
    }
    if (scenario.ppfd_umol_m2_s < 0.0) {
        error("SCENARIO.ppfd must be non-negative");
    }
    if (scenario.photoperiod_h < 0.0 || scenario.photoperiod_h > 24.0) {
        error("SCENARIO.photoperiod must lie in [0, 24] h");
    }
    if (scenario.co2_ppm < 0.0) {
        error("SCENARIO.co2 must be non-negative");
    }
    if (scenario.initial_leaf_dry_g < 0.0) {
        error("SCENARIO.initial_leaf_dry_mass must be non-negative");
    }
    if (scenario.ground_area_m2 <= 0.0) {
        error("SCENARIO.ground_area must be positive");
    }
    if (chamber.heat_capacity_kJ_per_K <= 0.0) {
        error("CHAMBER.heat_capacity must be positive");
    }
    if (chamber.cooling_capacity_kJ_per_day < 0.0) {
        error("CHAMBER.cooling_capacity must be non-negative");
    }

    // Accepted by the model, but the response shapes are undefined
    if (!(growth.base_temp_C < growth.opt_temp_C && growth.opt_temp_C < growth.max_temp_C)) {
        result.warnings.push_back("GROWTH cardinal temperatures are not ordered base < optimum < max");
    }
    if (!(growth.co2_ref_ppm < growth.co2_sat_ppm)) {
        result.warnings.push_back("GROWTH.co2_reference is not below GROWTH.co2_saturation");
    }
    if (!(growth.tt_emergence < growth.tt_tuber_init && growth.tt_tuber_init < growth.tt_maturity)) {
        result.warnings.push_back("GROWTH thermal-time thresholds are not ordered emergence < tuber_init < maturity");
    }
    if (growth.dry_to_fresh_ratio <= 0.0) {
        result.warnings.push_back("GROWTH.dry_to_fresh_ratio is not positive; fresh mass uses a floor");
    }

    return result;
}

// =============================================================================
// Template Generation
// =============================================================================

bool ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot create template file: " << filename << std::endl;
        return false;
    }

    ScenarioInput scn;
    GrowthParameters gp;
    ChamberParameters cp;

    file << "# TuberSim configuration\n";
    file << "# Values may carry units (e.g. '0.4 kW', '68 degF', '25 MJ/day').\n";
    file << "# Bare numbers use the unit shown in the comment.\n\n";

    file << "[SCENARIO]\n";
    file << "days = " << scn.days << "                          # Simulation length [day]\n";
    file << "ppfd = " << scn.ppfd_umol_m2_s << "                        # [umol/m2/s]\n";
    file << "photoperiod = " << scn.photoperiod_h << "                  # Lit hours per day [h]\n";
    file << "co2 = " << scn.co2_ppm << "                         # [ppm]\n";
    file << "target_temperature = " << scn.target_chamber_temp_C << "           # Cooling setpoint [degC]\n";
    file << "initial_leaf_dry_mass = " << scn.initial_leaf_dry_g << "         # [g]\n";
    file << "ground_area = " << scn.ground_area_m2 << "                  # Per plant [m2]\n\n";

    file << "[GROWTH]\n";
    file << "light_use_efficiency = " << gp.LUE_dry_g_per_MJ << "        # [g/MJ]\n";
    file << "par_fraction = " << gp.frac_PAR << "               # [-]\n";
    file << "specific_leaf_area = " << gp.SLA_m2_per_g_dry << "         # [m2/g]\n";
    file << "extinction_coefficient = " << gp.k_extinction << "    # [-]\n";
    file << "dry_to_fresh_ratio = " << gp.dry_to_fresh_ratio << "          # Dry matter fraction [-]\n";
    file << "base_temperature = " << gp.base_temp_C << "              # [degC]\n";
    file << "optimum_temperature = " << gp.opt_temp_C << "          # [degC]\n";
    file << "max_temperature = " << gp.max_temp_C << "              # [degC]\n";
    file << "co2_reference = " << gp.co2_ref_ppm << "               # [ppm]\n";
    file << "co2_saturation = " << gp.co2_sat_ppm << "             # [ppm]\n";
    file << "tt_emergence = " << gp.tt_emergence << "                # [degC-day]\n";
    file << "tt_tuber_init = " << gp.tt_tuber_init << "               # [degC-day]\n";
    file << "tt_maturity = " << gp.tt_maturity << "                # [degC-day]\n";
    file << "maintenance_fraction = " << gp.maint_frac_per_day << "     # [1/day]\n\n";

    file << "[CHAMBER]\n";
    file << "heat_capacity = " << cp.heat_capacity_kJ_per_K << "             # [kJ/K]\n";
    file << "heat_loss_coefficient = " << cp.U_kJ_per_day_per_K << "      # [kJ/day/K]\n";
    file << "led_power = " << cp.led_power_W << "                  # [W]\n";
    file << "other_power = " << cp.other_power_W << "                 # [W]\n";
    file << "cooling_capacity = " << cp.cooling_capacity_kJ_per_day << "         # [kJ/day]\n";
    file << "ambient_temperature = " << cp.ambient_temp_C << "         # [degC]\n\n";

    file << "[OUTPUT]\n";
    file << "print_series = false\n";
    file << "series_stride = 10\n";

    file.close();
    return !file.fail();
}

} // namespace TuberSim
