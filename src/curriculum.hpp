#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace curbench {

struct Unit {
    std::string unit_id;
    std::string module_code;
    std::string title;
    std::string indicative_content;
    std::vector<std::string> assessment_methods;
    std::optional<double> hours;
};

struct Curriculum {
    std::string program_id;
    std::optional<double> total_hours;
    std::vector<Unit> units;

    // total_hours if set, else the sum of unit hours, else nullopt.
    std::optional<double> declared_hours() const;

    // Distinct assessment methods across units (case-sensitive), first-seen order.
    std::vector<std::string> assessment_methods() const;
};

// Unit titles verbatim plus indicative-content fragments (split on , ; . and
// newline, trimmed, longer than 3 characters), deduplicated in first-seen order.
std::vector<std::string> extract_topics(const std::vector<Unit>& units);

// Throws std::invalid_argument when program_id is missing.
Curriculum curriculum_from_json(const nlohmann::json& j);
nlohmann::json curriculum_to_json(const Curriculum& curriculum);

} // namespace curbench
