#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace curbench {

enum class FindingType { Topic, Assessment, Structure };
enum class Severity { High, Medium, Low };

struct InstitutionComparison {
    std::string institution_name;
    std::string program_name;
    long similarity_score = 0;      // 0-100
    long topic_coverage = 0;
    long assessment_alignment = 0;
    long structure_alignment = 0;
};

struct Gap {
    FindingType type = FindingType::Topic;
    std::string description;
    std::string competitor_institution;
    Severity severity = Severity::Low;
    std::string recommendation;
};

struct Strength {
    FindingType type = FindingType::Topic;
    std::string description;
    std::string advantage;
};

struct BenchmarkReport {
    std::string program_id;
    std::string generated_at;       // ISO 8601 (UTC)
    std::vector<InstitutionComparison> comparisons;
    long overall_similarity = 0;    // 0-100
    std::vector<Gap> gaps;
    std::vector<Strength> strengths;
    std::vector<std::string> recommendations;
    std::string summary;
};

std::string finding_type_to_string(FindingType type);
std::string severity_to_string(Severity severity);

uint32_t count_severity(const std::vector<Gap>& gaps, Severity severity);

// Unrounded mean of the comparison similarity scores (0 when empty).
double mean_similarity(const std::vector<InstitutionComparison>& comparisons);

// Mean similarity rounded half up.
long overall_similarity(const std::vector<InstitutionComparison>& comparisons);

nlohmann::json comparison_to_json(const InstitutionComparison& c);
nlohmann::json report_to_json(const BenchmarkReport& report);

} // namespace curbench
