#include "report.hpp"
#include "util.hpp"
#include <algorithm>

namespace curbench {

std::string finding_type_to_string(FindingType type) {
    switch (type) {
        case FindingType::Topic:      return "topic";
        case FindingType::Assessment: return "assessment";
        case FindingType::Structure:  return "structure";
    }
    return "topic";
}

std::string severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::High:   return "high";
        case Severity::Medium: return "medium";
        case Severity::Low:    return "low";
    }
    return "low";
}

uint32_t count_severity(const std::vector<Gap>& gaps, Severity severity) {
    return static_cast<uint32_t>(std::count_if(gaps.begin(), gaps.end(),
        [severity](const Gap& g) { return g.severity == severity; }));
}

double mean_similarity(const std::vector<InstitutionComparison>& comparisons) {
    if (comparisons.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& c : comparisons) sum += static_cast<double>(c.similarity_score);
    return sum / static_cast<double>(comparisons.size());
}

long overall_similarity(const std::vector<InstitutionComparison>& comparisons) {
    return round_half_up(mean_similarity(comparisons));
}

nlohmann::json comparison_to_json(const InstitutionComparison& c) {
    return {
        {"institution_name", c.institution_name},
        {"program_name", c.program_name},
        {"similarity_score", c.similarity_score},
        {"topic_coverage", c.topic_coverage},
        {"assessment_alignment", c.assessment_alignment},
        {"structure_alignment", c.structure_alignment}
    };
}

nlohmann::json report_to_json(const BenchmarkReport& report) {
    nlohmann::json comparisons = nlohmann::json::array();
    for (const auto& c : report.comparisons) comparisons.push_back(comparison_to_json(c));

    nlohmann::json gaps = nlohmann::json::array();
    for (const auto& g : report.gaps) {
        gaps.push_back({
            {"type", finding_type_to_string(g.type)},
            {"description", g.description},
            {"competitor_institution", g.competitor_institution},
            {"severity", severity_to_string(g.severity)},
            {"recommendation", g.recommendation}
        });
    }

    nlohmann::json strengths = nlohmann::json::array();
    for (const auto& s : report.strengths) {
        strengths.push_back({
            {"type", finding_type_to_string(s.type)},
            {"description", s.description},
            {"advantage", s.advantage}
        });
    }

    return {
        {"program_id", report.program_id},
        {"generated_at", report.generated_at},
        {"comparisons", comparisons},
        {"overall_similarity", report.overall_similarity},
        {"gaps", gaps},
        {"strengths", strengths},
        {"recommendations", report.recommendations},
        {"summary", report.summary}
    };
}

} // namespace curbench
