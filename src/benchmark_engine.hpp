#pragma once
#include "competitor.hpp"
#include "config.hpp"
#include "curriculum.hpp"
#include "report.hpp"
#include "similarity.hpp"
#include <string>
#include <vector>

namespace curbench {

class Embedder; // forward declare

// One competitor's comparison plus the findings it produced.
struct CompetitorComparison {
    InstitutionComparison comparison;
    std::vector<Gap> gaps;
    std::vector<Strength> strengths;
};

// Percentage of competitor assessment types matched by a generated method
// (case-insensitive substring either way), capped at 100. 50 when the
// competitor declares none.
double assessment_alignment(const Curriculum& curriculum, const ProgramStructure& structure);

// Mean of the hours and module-count closeness scores the competitor
// declares data for; 50 when it declares neither.
double structure_alignment(const Curriculum& curriculum, const ProgramStructure& structure,
                           double default_program_hours);

// Score one competitor from precomputed topic vectors. No external calls.
CompetitorComparison score_competitor(const std::vector<std::string>& topics,
                                      const std::vector<Embedding>& topic_vectors,
                                      const std::vector<Embedding>& competitor_vectors,
                                      const Curriculum& curriculum,
                                      const CompetitorProgram& competitor,
                                      const BenchmarkConfig& config);

std::vector<std::string> build_recommendations(const std::vector<Gap>& gaps,
                                               const std::vector<Strength>& strengths);

std::string build_summary(const std::vector<InstitutionComparison>& comparisons,
                          const std::vector<Gap>& gaps,
                          const std::vector<Strength>& strengths);

class BenchmarkEngine {
public:
    // `competitors` may be null; benchmark_program() then has nothing to compare against.
    BenchmarkEngine(Embedder& embedder, const Config& config,
                    CompetitorStore* competitors = nullptr);

    // Compare a generated curriculum against the given competitors.
    // Throws BenchmarkFailed (carrying program_id) when embedding fails.
    BenchmarkReport compare_curriculum(const std::string& program_id,
                                       const std::vector<std::string>& topics,
                                       const Curriculum& curriculum,
                                       const std::vector<CompetitorProgram>& competitors);

    // Embed the competitor's topics and score it against the generated topics.
    CompetitorComparison compare_with_competitor(const std::vector<std::string>& topics,
                                                 const std::vector<Embedding>& topic_vectors,
                                                 const Curriculum& curriculum,
                                                 const CompetitorProgram& competitor);

    // Extract topics and compare against every stored competitor, newest first.
    BenchmarkReport benchmark_program(const Curriculum& curriculum);

private:
    std::vector<Embedding> embed_texts(const std::vector<std::string>& texts);
    CompetitorComparison compare_one(const std::vector<std::string>& topics,
                                     const std::vector<Embedding>& topic_vectors,
                                     const Curriculum& curriculum,
                                     const CompetitorProgram& competitor);

    Embedder& embedder_;
    CompetitorStore* competitors_;
    BenchmarkConfig config_;
    uint32_t max_concurrency_;
};

} // namespace curbench
