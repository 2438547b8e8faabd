// common/measurement_fields.cpp
#include "measurement_fields.hpp"
#include <unordered_map>

namespace {

constexpr const char* V = "NUMERIC(10, 3)";
constexpr const char* PF = "NUMERIC(5, 3)";
constexpr const char* HZ = "NUMERIC(6, 3)";
constexpr const char* WH = "NUMERIC(15, 3)";
constexpr const char* THD = "NUMERIC(6, 3)";
constexpr const char* ENV = "NUMERIC(6, 2)";

const std::vector<MeasurementField> kFields = {
    {"VR", "vr", V, FieldGroup::Voltage},
    {"VY", "vy", V, FieldGroup::Voltage},
    {"VB", "vb", V, FieldGroup::Voltage},
    {"V1", "v1", V, FieldGroup::Voltage},
    {"V2", "v2", V, FieldGroup::Voltage},
    {"V3", "v3", V, FieldGroup::Voltage},
    {"V", "v", V, FieldGroup::Voltage},
    {"Vavg", "vavg", V, FieldGroup::Voltage},
    {"Vpeak", "vpeak", V, FieldGroup::Voltage},

    {"IR", "ir", V, FieldGroup::Current},
    {"IY", "iy", V, FieldGroup::Current},
    {"IB", "ib", V, FieldGroup::Current},
    {"I1", "i1", V, FieldGroup::Current},
    {"I2", "i2", V, FieldGroup::Current},
    {"I3", "i3", V, FieldGroup::Current},
    {"I", "i", V, FieldGroup::Current},
    {"Iavg", "iavg", V, FieldGroup::Current},
    {"Ipeak", "ipeak", V, FieldGroup::Current},

    {"P1", "p1", V, FieldGroup::Power},
    {"P2", "p2", V, FieldGroup::Power},
    {"P3", "p3", V, FieldGroup::Power},
    {"Ptotal", "ptotal", V, FieldGroup::Power},
    {"Q1", "q1", V, FieldGroup::Power},
    {"Q2", "q2", V, FieldGroup::Power},
    {"Q3", "q3", V, FieldGroup::Power},
    {"Qtotal", "qtotal", V, FieldGroup::Power},
    {"S1", "s1", V, FieldGroup::Power},
    {"S2", "s2", V, FieldGroup::Power},
    {"S3", "s3", V, FieldGroup::Power},
    {"Stotal", "stotal", V, FieldGroup::Power},

    {"PF1", "pf1", PF, FieldGroup::PowerFactor},
    {"PF2", "pf2", PF, FieldGroup::PowerFactor},
    {"PF3", "pf3", PF, FieldGroup::PowerFactor},
    {"PFavg", "pfavg", PF, FieldGroup::PowerFactor},
    {"PF", "pf", PF, FieldGroup::PowerFactor},

    {"frequency", "frequency", HZ, FieldGroup::Frequency},

    {"energy_active", "energy_active", WH, FieldGroup::Energy},
    {"energy_reactive", "energy_reactive", WH, FieldGroup::Energy},
    {"energy_apparent", "energy_apparent", WH, FieldGroup::Energy},

    {"THD_V1", "thd_v1", THD, FieldGroup::Harmonics},
    {"THD_V2", "thd_v2", THD, FieldGroup::Harmonics},
    {"THD_V3", "thd_v3", THD, FieldGroup::Harmonics},
    {"THD_I1", "thd_i1", THD, FieldGroup::Harmonics},
    {"THD_I2", "thd_i2", THD, FieldGroup::Harmonics},
    {"THD_I3", "thd_i3", THD, FieldGroup::Harmonics},
    {"THD_V", "thd_v", THD, FieldGroup::Harmonics},
    {"THD_I", "thd_i", THD, FieldGroup::Harmonics},

    {"temperature", "temperature", ENV, FieldGroup::Environmental},
    {"humidity", "humidity", ENV, FieldGroup::Environmental},
};

} // namespace

const std::vector<MeasurementField>& measurement_fields() {
    return kFields;
}

const MeasurementField* find_measurement_field(const std::string& name) {
    static const std::unordered_map<std::string, const MeasurementField*> index = [] {
        std::unordered_map<std::string, const MeasurementField*> m;
        for (const auto& f : kFields) {
            m.emplace(f.name, &f);
        }
        return m;
    }();

    auto it = index.find(name);
    return it == index.end() ? nullptr : it->second;
}

const char* field_group_name(FieldGroup group) {
    switch (group) {
        case FieldGroup::Voltage: return "voltage";
        case FieldGroup::Current: return "current";
        case FieldGroup::Power: return "power";
        case FieldGroup::PowerFactor: return "power factor";
        case FieldGroup::Frequency: return "frequency";
        case FieldGroup::Energy: return "energy";
        case FieldGroup::Harmonics: return "harmonics";
        case FieldGroup::Environmental: return "environmental";
    }
    return "unknown";
}
