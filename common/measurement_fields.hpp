// common/measurement_fields.hpp
#pragma once
#include <cstddef>
#include <string>
#include <vector>

enum class FieldGroup {
    Voltage,
    Current,
    Power,
    PowerFactor,
    Frequency,
    Energy,
    Harmonics,
    Environmental
};

// One nullable numeric column of a device relation.
// `name` is the wire/parameter name, `column` the SQL column (lower case).
struct MeasurementField {
    const char* name;
    const char* column;
    const char* sql_type;
    FieldGroup group;
};

// Fixed, ordered column set shared by table creation, ingestion and queries.
const std::vector<MeasurementField>& measurement_fields();

// Lookup by parameter name (case-sensitive). Returns nullptr for unknown names.
const MeasurementField* find_measurement_field(const std::string& name);

// Columns backing the partial indexes and the aggregate query.
constexpr const char* kTotalPowerColumn = "ptotal";
constexpr const char* kAvgPowerFactorColumn = "pfavg";
constexpr const char* kFrequencyColumn = "frequency";

const char* field_group_name(FieldGroup group);
