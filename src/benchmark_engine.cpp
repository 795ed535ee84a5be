#include "benchmark_engine.hpp"
#include "cancel.hpp"
#include "embedder.hpp"
#include "errors.hpp"
#include "fanout.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>

namespace curbench {

double assessment_alignment(const Curriculum& curriculum, const ProgramStructure& structure) {
    if (!structure.assessment_types || structure.assessment_types->empty()) {
        return 50.0;
    }

    std::set<std::string> generated;
    for (const auto& m : curriculum.assessment_methods()) {
        generated.insert(to_lower(m));
    }

    size_t matched = 0;
    for (const auto& type : *structure.assessment_types) {
        std::string comp = to_lower(type);
        for (const auto& gen : generated) {
            if (gen.find(comp) != std::string::npos || comp.find(gen) != std::string::npos) {
                matched++;
                break;
            }
        }
    }

    double alignment = static_cast<double>(matched) /
                       static_cast<double>(structure.assessment_types->size()) * 100.0;
    return std::min(alignment, 100.0);
}

double structure_alignment(const Curriculum& curriculum, const ProgramStructure& structure,
                           double default_program_hours) {
    double total = 0.0;
    int factors = 0;

    if (structure.total_hours && *structure.total_hours > 0) {
        double comp = *structure.total_hours;
        double gen = curriculum.declared_hours().value_or(default_program_hours);
        total += std::max(0.0, 100.0 - std::fabs(gen - comp) / comp * 100.0);
        factors++;
    }

    if (structure.modules && !structure.modules->empty()) {
        auto comp = static_cast<double>(structure.modules->size());
        auto gen = static_cast<double>(curriculum.units.size());
        total += std::max(0.0, 100.0 - std::fabs(gen - comp) / comp * 50.0);
        factors++;
    }

    return factors > 0 ? total / factors : 50.0;
}

static Severity severity_for(double best, const BenchmarkConfig& config) {
    if (best < config.high_severity_below) return Severity::High;
    if (best < config.medium_severity_below) return Severity::Medium;
    return Severity::Low;
}

CompetitorComparison score_competitor(const std::vector<std::string>& topics,
                                      const std::vector<Embedding>& topic_vectors,
                                      const std::vector<Embedding>& competitor_vectors,
                                      const Curriculum& curriculum,
                                      const CompetitorProgram& competitor,
                                      const BenchmarkConfig& config) {
    CompetitorComparison out;
    uint32_t skipped = 0;

    // Topic coverage and strengths: generated topic vs competitor topics.
    size_t covered = 0;
    for (size_t i = 0; i < topic_vectors.size(); ++i) {
        double best = best_match(topic_vectors[i], competitor_vectors, &skipped);
        if (best > config.coverage_threshold) covered++;
        if (best < config.strength_threshold) {
            out.strengths.push_back(Strength{
                FindingType::Topic,
                "Unique topic: \"" + topics[i] + "\"",
                "This topic provides additional coverage not found in competitor programs"});
        }
    }
    double coverage = topic_vectors.empty()
        ? 0.0
        : static_cast<double>(covered) / static_cast<double>(topic_vectors.size()) * 100.0;

    // Gaps: competitor topic vs generated topics.
    for (size_t i = 0; i < competitor.topics.size() && i < competitor_vectors.size(); ++i) {
        double best = best_match(competitor_vectors[i], topic_vectors, &skipped);
        if (best >= config.gap_threshold) continue;

        const std::string& name = topic_name(competitor.topics[i]);
        out.gaps.push_back(Gap{
            FindingType::Topic,
            "Topic \"" + name + "\" is covered by " + competitor.institution_name +
                " but not adequately addressed in the generated curriculum",
            competitor.institution_name,
            severity_for(best, config),
            "Consider adding content on \"" + name + "\" to improve curriculum comprehensiveness"});
    }

    if (skipped > 0) {
        std::cerr << "[benchmark] Skipped " << skipped
                  << " topic comparisons with mismatched embedding dimensions for "
                  << competitor.institution_name << "\n";
    }

    const auto& declared = competitor.structure.assessment_types;
    size_t methods = curriculum.assessment_methods().size();
    if (declared && methods > declared->size()) {
        out.strengths.push_back(Strength{
            FindingType::Assessment,
            "More diverse assessment methods",
            "Curriculum includes " + std::to_string(methods) +
                " assessment types compared to competitor's " +
                std::to_string(declared->size())});
    }

    double assessment = assessment_alignment(curriculum, competitor.structure);
    double structure = structure_alignment(curriculum, competitor.structure,
                                           config.default_program_hours);

    auto& c = out.comparison;
    c.institution_name = competitor.institution_name;
    c.program_name = competitor.program_name;
    c.similarity_score = round_half_up(coverage * 0.5 + assessment * 0.25 + structure * 0.25);
    c.topic_coverage = round_half_up(coverage);
    c.assessment_alignment = round_half_up(assessment);
    c.structure_alignment = round_half_up(structure);
    return out;
}

std::vector<std::string> build_recommendations(const std::vector<Gap>& gaps,
                                               const std::vector<Strength>& strengths) {
    std::vector<std::string> recs;

    uint32_t high = count_severity(gaps, Severity::High);
    uint32_t medium = count_severity(gaps, Severity::Medium);

    if (high > 0) {
        recs.push_back("Priority: Address " + std::to_string(high) +
                       " high-severity content gaps to ensure curriculum competitiveness");
        uint32_t listed = 0;
        for (const auto& g : gaps) {
            if (g.severity != Severity::High) continue;
            if (listed++ == 3) break;
            recs.push_back(g.recommendation);
        }
    }

    if (medium > 0) {
        recs.push_back("Consider addressing " + std::to_string(medium) +
                       " medium-severity gaps to enhance curriculum depth");
    }

    if (!strengths.empty()) {
        recs.push_back("Leverage " + std::to_string(strengths.size()) +
                       " unique strengths in marketing materials to differentiate from competitors");
    }

    if (gaps.empty()) {
        recs.push_back("Curriculum demonstrates excellent coverage compared to competitors. "
                       "Continue monitoring industry trends.");
    }

    if (recs.empty()) {
        recs.push_back("Curriculum is well-aligned with competitor offerings");
    }
    return recs;
}

std::string build_summary(const std::vector<InstitutionComparison>& comparisons,
                          const std::vector<Gap>& gaps,
                          const std::vector<Strength>& strengths) {
    double avg = mean_similarity(comparisons);

    std::string summary = "Benchmarking analysis compared the generated curriculum against " +
                          std::to_string(comparisons.size()) + " competitor institution(s). ";
    summary += "The overall similarity score is " + std::to_string(round_half_up(avg)) +
               "%, indicating ";

    if (avg >= 80.0) {
        summary += "strong alignment with industry standards. ";
    } else if (avg >= 60.0) {
        summary += "moderate alignment with opportunities for enhancement. ";
    } else {
        summary += "significant opportunities for improvement to match competitor offerings. ";
    }

    summary += "Analysis identified " + std::to_string(gaps.size()) + " content gap(s) and " +
               std::to_string(strengths.size()) + " unique strength(s).";

    uint32_t high = count_severity(gaps, Severity::High);
    if (high > 0) {
        summary += " " + std::to_string(high) + " high-priority gap(s) require immediate attention.";
    }
    return summary;
}

BenchmarkEngine::BenchmarkEngine(Embedder& embedder, const Config& config,
                                 CompetitorStore* competitors)
    : embedder_(embedder)
    , competitors_(competitors)
    , config_(config.benchmark)
    , max_concurrency_(config.embeddings.max_concurrency)
{}

std::vector<Embedding> BenchmarkEngine::embed_texts(const std::vector<std::string>& texts) {
    CancelToken cancel;
    return embed_all(embedder_, texts, cancel, max_concurrency_);
}

CompetitorComparison BenchmarkEngine::compare_one(const std::vector<std::string>& topics,
                                                  const std::vector<Embedding>& topic_vectors,
                                                  const Curriculum& curriculum,
                                                  const CompetitorProgram& competitor) {
    auto competitor_vectors = embed_texts(topic_names(competitor));
    return score_competitor(topics, topic_vectors, competitor_vectors, curriculum, competitor,
                            config_);
}

CompetitorComparison BenchmarkEngine::compare_with_competitor(
    const std::vector<std::string>& topics, const std::vector<Embedding>& topic_vectors,
    const Curriculum& curriculum, const CompetitorProgram& competitor) {
    try {
        return compare_one(topics, topic_vectors, curriculum, competitor);
    } catch (const EmbedError&) {
        throw BenchmarkFailed("compare_with_competitor", competitor.institution_name,
                              std::current_exception());
    }
}

BenchmarkReport BenchmarkEngine::compare_curriculum(
    const std::string& program_id, const std::vector<std::string>& topics,
    const Curriculum& curriculum, const std::vector<CompetitorProgram>& competitors) {
    BenchmarkReport report;
    report.program_id = program_id;
    report.generated_at = timestamp_now();

    if (competitors.empty()) {
        report.recommendations.push_back("No competitor programs available for comparison");
        report.summary = "No competitor data available for benchmarking";
        return report;
    }

    try {
        auto topic_vectors = embed_texts(topics);
        for (const auto& competitor : competitors) {
            auto result = compare_one(topics, topic_vectors, curriculum, competitor);
            report.comparisons.push_back(std::move(result.comparison));
            report.gaps.insert(report.gaps.end(), result.gaps.begin(), result.gaps.end());
            report.strengths.insert(report.strengths.end(),
                                    result.strengths.begin(), result.strengths.end());
        }
    } catch (const EmbedError&) {
        throw BenchmarkFailed("compare_curriculum", program_id, std::current_exception());
    }

    report.overall_similarity = overall_similarity(report.comparisons);

    report.recommendations = build_recommendations(report.gaps, report.strengths);
    report.summary = build_summary(report.comparisons, report.gaps, report.strengths);

    std::cerr << "[benchmark] Program " << program_id << " compared against "
              << report.comparisons.size() << " competitor(s): " << report.gaps.size()
              << " gap(s), " << report.strengths.size() << " strength(s)\n";
    return report;
}

BenchmarkReport BenchmarkEngine::benchmark_program(const Curriculum& curriculum) {
    std::vector<CompetitorProgram> programs;
    if (competitors_) {
        programs = competitors_->list();
    } else {
        std::cerr << "[benchmark] No competitor store configured\n";
    }
    return compare_curriculum(curriculum.program_id, extract_topics(curriculum.units),
                              curriculum, programs);
}

} // namespace curbench
