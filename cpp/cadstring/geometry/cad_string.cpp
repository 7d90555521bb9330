#include "cadstring/geometry/cad_string.h"
#include <array>

namespace {
struct StringTypeInfo {
    StringType type;
    const char* key;
    const char* label;
};

constexpr std::array<StringTypeInfo, kStringTypeCount> kStringTypes = {{
    {StringType::PitBoundary, "pit_boundary", "Pit Boundary"},
    {StringType::BenchCrest, "bench_crest", "Bench Crest"},
    {StringType::BenchToe, "bench_toe", "Bench Toe"},
    {StringType::HaulRoad, "haul_road", "Haul Road"},
    {StringType::Ramp, "ramp", "Ramp"},
    {StringType::Contour, "contour", "Contour"},
    {StringType::DrillPattern, "drill_pattern", "Drill Pattern"},
    {StringType::SurveyTraverse, "survey_traverse", "Survey Traverse"},
    {StringType::PowerLine, "power_line", "Power Line"},
    {StringType::WaterLine, "water_line", "Water Line"},
    {StringType::FenceLine, "fence_line", "Fence Line"},
    {StringType::GeologicalContact, "geological_contact", "Geological Contact"},
    {StringType::Fault, "fault", "Fault"},
    {StringType::Boundary, "boundary", "Boundary"},
    {StringType::Custom, "custom", "Custom"},
}};
} // namespace

const char* stringTypeKey(StringType type) {
    const auto index = static_cast<std::size_t>(type);
    if (index >= kStringTypes.size()) return "custom";
    return kStringTypes[index].key;
}

const char* stringTypeLabel(StringType type) {
    const auto index = static_cast<std::size_t>(type);
    if (index >= kStringTypes.size()) return "Custom";
    return kStringTypes[index].label;
}

StringType parseStringType(std::string_view key) {
    for (const auto& info : kStringTypes) {
        if (key == info.key) return info.type;
    }
    return StringType::Custom;
}
