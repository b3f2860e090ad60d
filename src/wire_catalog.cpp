#include "wiresag/wire_catalog.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace wiresag {

namespace {

enum class Field {
    TYPE,
    NAME,
    CROSS_SECTION,
    DIAMETER,
    UNIT_WEIGHT,
    RESISTANCE,
    RESISTANCE_TEMP_COEF,
    BREAKING_STRENGTH,
    SAFETY_FACTOR,
    ELASTIC_MODULUS,
    THERMAL_EXPANSION
};

struct ColumnSpec {
    Field field;
    const char* label;
    bool required;
    bool numeric;
    double scale;                       // display unit -> SI
    std::vector<std::string> headers;   // accepted header names
};

// Japanese headers are those of the utility conductor tables the
// catalog format was taken from; English aliases follow each of them.
const std::vector<ColumnSpec>& column_specs() {
    static const std::vector<ColumnSpec> specs = {
        {Field::TYPE, "type", true, false, 1.0,
         {"呼称", "type", "designation"}},
        {Field::NAME, "name", false, false, 1.0,
         {"線種", "name", "kind"}},
        {Field::CROSS_SECTION, "cross_section", true, true, 1e-6,
         {"計算断面積(mm2)", "cross_section_mm2"}},
        {Field::DIAMETER, "diameter", false, true, 1e-3,
         {"外径(mm)", "diameter_mm"}},
        {Field::UNIT_WEIGHT, "unit_weight", true, true, 1.0,
         {"単位重量(N/m)", "unit_weight_n_per_m", "weight_n_per_m"}},
        {Field::RESISTANCE, "resistance", false, true, 1.0,
         {"電気抵抗(Ω/km at 20℃)", "resistance_ohm_per_km"}},
        {Field::RESISTANCE_TEMP_COEF, "resistance_temp_coef", false, true, 1.0,
         {"抵抗温度係数(/℃)", "resistance_temp_coef"}},
        {Field::BREAKING_STRENGTH, "breaking_strength", false, true, 1e3,
         {"破壊強度(kN)", "breaking_strength_kn"}},
        {Field::SAFETY_FACTOR, "safety_factor", false, true, 1.0,
         {"安全率", "safety_factor"}},
        {Field::ELASTIC_MODULUS, "elastic_modulus", true, true, 1e9,
         {"弾性係数(N/m2 ×109)", "elastic_modulus_gpa"}},
        {Field::THERMAL_EXPANSION, "thermal_expansion", true, true, 1e-6,
         {"線膨張係数×10-6", "thermal_expansion_1e-6"}},
    };
    return specs;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(begin, end - begin);
}

std::string to_lower_ascii(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

// Split one CSV line; double quotes group fields and "" escapes a quote.
std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current += '"';
                    i++;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(trim(current));
    return fields;
}

double parse_number(const std::string& cell, const std::string& filename,
                    int line_number, const char* label) {
    size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(cell, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(filename + ":" + std::to_string(line_number) +
                                 ": cannot parse " + label + " '" + cell + "'");
    }
    if (trim(cell.substr(pos)).size() > 0) {
        throw std::runtime_error(filename + ":" + std::to_string(line_number) +
                                 ": trailing characters in " + label + " '" + cell + "'");
    }
    if (!std::isfinite(value)) {
        throw std::runtime_error(filename + ":" + std::to_string(line_number) +
                                 ": non-finite " + label + " '" + cell + "'");
    }
    return value;
}

// Temperature coefficients may be negative; physical sizes and strengths not
bool allows_negative(Field field) {
    return field == Field::THERMAL_EXPANSION || field == Field::RESISTANCE_TEMP_COEF;
}

void assign_field(WireRecord& record, Field field, double value) {
    switch (field) {
        case Field::CROSS_SECTION:        record.cross_section = value; break;
        case Field::DIAMETER:             record.diameter = value; break;
        case Field::UNIT_WEIGHT:          record.unit_weight = value; break;
        case Field::RESISTANCE:           record.resistance = value; break;
        case Field::RESISTANCE_TEMP_COEF: record.resistance_temp_coef = value; break;
        case Field::BREAKING_STRENGTH:    record.breaking_strength = value; break;
        case Field::SAFETY_FACTOR:        record.safety_factor = value; break;
        case Field::ELASTIC_MODULUS:      record.elastic_modulus = value; break;
        case Field::THERMAL_EXPANSION:    record.thermal_expansion = value; break;
        case Field::TYPE:
        case Field::NAME:
            break;
    }
}

}  // namespace

WireProperties WireRecord::properties() const {
    WireProperties props(unit_weight, cross_section, elastic_modulus, thermal_expansion);
    props.type = type;
    return props;
}

double WireRecord::allowable_tension() const {
    if (safety_factor <= 0.0) return 0.0;
    return breaking_strength / safety_factor;
}

void WireCatalog::load_from_csv(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open wire table: " + filename);
    }

    std::string line;
    int line_number = 0;

    // Header row (skip leading blank lines)
    std::vector<std::string> header;
    while (std::getline(file, line)) {
        line_number++;
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        if (line_number == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line = line.substr(3);
        }
        if (trim(line).empty()) continue;
        header = split_csv_line(line);
        break;
    }
    if (header.empty()) {
        throw std::runtime_error("Wire table has no header row: " + filename);
    }

    // File column per known column, -1 if absent
    const auto& specs = column_specs();
    std::vector<int> column_of(specs.size(), -1);
    for (size_t s = 0; s < specs.size(); s++) {
        for (size_t c = 0; c < header.size() && column_of[s] < 0; c++) {
            std::string cell = to_lower_ascii(header[c]);
            for (const auto& accepted : specs[s].headers) {
                if (cell == to_lower_ascii(accepted)) {
                    column_of[s] = static_cast<int>(c);
                    break;
                }
            }
        }
        if (column_of[s] < 0) {
            if (specs[s].required) {
                throw std::runtime_error("Wire table " + filename +
                                         " is missing required column '" +
                                         specs[s].label + "'");
            }
            std::cerr << "[WireCatalog] Column '" << specs[s].label
                      << "' not found in " << filename << ", defaulting to 0\n";
        }
    }

    std::vector<WireRecord> loaded;
    while (std::getline(file, line)) {
        line_number++;
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        if (trim(line).empty()) continue;

        std::vector<std::string> cells = split_csv_line(line);
        WireRecord record;

        for (size_t s = 0; s < specs.size(); s++) {
            int col = column_of[s];
            if (col < 0) continue;
            std::string cell = (col < static_cast<int>(cells.size())) ? cells[col] : "";

            if (cell.empty()) {
                if (specs[s].required) {
                    throw std::runtime_error(filename + ":" + std::to_string(line_number) +
                                             ": empty " + specs[s].label);
                }
                continue;
            }

            if (specs[s].field == Field::TYPE) {
                record.type = cell;
            } else if (specs[s].field == Field::NAME) {
                record.name = cell;
            } else {
                double value = parse_number(cell, filename, line_number, specs[s].label);
                if (value < 0.0 && !allows_negative(specs[s].field)) {
                    throw std::runtime_error(filename + ":" + std::to_string(line_number) +
                                             ": negative " + specs[s].label + " '" + cell + "'");
                }
                assign_field(record, specs[s].field, value * specs[s].scale);
            }
        }

        if (!(record.unit_weight > 0.0)) {
            throw std::runtime_error(filename + ":" + std::to_string(line_number) +
                                     ": unit weight must be positive for '" +
                                     record.type + "'");
        }
        loaded.push_back(record);
    }

    // Commit only once the whole file parsed
    WireCatalog fresh;
    for (size_t i = 0; i < loaded.size(); i++) {
        fresh.add_record(loaded[i], filename);
    }
    *this = std::move(fresh);
}

void WireCatalog::load_from_records(const std::vector<WireRecord>& records) {
    WireCatalog fresh;
    for (const auto& r : records) {
        if (!(r.unit_weight > 0.0) || !std::isfinite(r.unit_weight)) {
            throw std::invalid_argument("Unit weight must be positive for '" + r.type + "'");
        }
        fresh.add_record(r, "record list");
    }
    *this = std::move(fresh);
}

void WireCatalog::add_record(const WireRecord& record, const std::string& origin) {
    if (record.type.empty()) {
        throw std::runtime_error("Wire record without designation in " + origin);
    }
    if (index_.count(record.type) > 0) {
        throw std::runtime_error("Duplicate wire type '" + record.type + "' in " + origin);
    }
    index_[record.type] = static_cast<int>(records_.size());
    records_.push_back(record);
}

const WireRecord* WireCatalog::find(const std::string& type) const {
    auto it = index_.find(type);
    if (it == index_.end()) return nullptr;
    return &records_[it->second];
}

const WireRecord& WireCatalog::at(const std::string& type) const {
    const WireRecord* record = find(type);
    if (record == nullptr) {
        throw std::invalid_argument("Unknown wire type: " + type);
    }
    return *record;
}

WireProperties WireCatalog::properties(const std::string& type) const {
    return at(type).properties();
}

std::vector<std::string> WireCatalog::types() const {
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const auto& r : records_) {
        out.push_back(r.type);
    }
    return out;
}

}  // namespace wiresag
