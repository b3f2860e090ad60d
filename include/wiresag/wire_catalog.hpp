#pragma once

#include "wiresag/wire.hpp"
#include <map>

namespace wiresag {

// One row of a conductor table, converted to SI units on load.
struct WireRecord {
    std::string type;                   // Designation, catalog key
    std::string name;                   // Conductor kind
    double cross_section = 0.0;         // m^2
    double diameter = 0.0;              // Outer diameter (m)
    double unit_weight = 0.0;           // N/m
    double resistance = 0.0;            // Ohm/km at 20 degC
    double resistance_temp_coef = 0.0;  // 1/degC
    double breaking_strength = 0.0;     // N
    double safety_factor = 0.0;
    double elastic_modulus = 0.0;       // Pa
    double thermal_expansion = 0.0;     // 1/degC

    WireProperties properties() const;

    // Breaking strength / safety factor (N), 0 when no safety factor is set
    double allowable_tension() const;
};

// Conductor lookup table owned by the caller. Load once, pass by reference.
class WireCatalog {
public:
    // Load a UTF-8 CSV table with a header row. Columns are matched by
    // header name; display units (mm2, mm, kN, x1e9 N/m2, x1e-6 /degC)
    // are converted to SI.
    void load_from_csv(const std::string& filename);
    void load_from_records(const std::vector<WireRecord>& records);

    // Returns nullptr if not found
    const WireRecord* find(const std::string& type) const;

    const WireRecord& at(const std::string& type) const;
    WireProperties properties(const std::string& type) const;

    // Designations in load order
    std::vector<std::string> types() const;

    const std::vector<WireRecord>& records() const { return records_; }
    int size() const { return static_cast<int>(records_.size()); }
    bool empty() const { return records_.empty(); }

private:
    std::vector<WireRecord> records_;
    std::map<std::string, int> index_;

    void add_record(const WireRecord& record, const std::string& origin);
};

}  // namespace wiresag
