#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace curbench {

struct DetailedTopic {
    std::string name;
    std::optional<std::string> description;
    std::optional<double> hours;
    std::optional<std::string> module_code;
};

// A competitor topic is either a bare name or a detailed record.
using CompetitorTopic = std::variant<std::string, DetailedTopic>;

const std::string& topic_name(const CompetitorTopic& topic);

struct CompetitorModule {
    std::string code;
    std::string title;
    double hours = 0.0;
    std::vector<std::string> topics;
};

struct ProgramStructure {
    std::optional<double> total_hours;
    std::optional<std::vector<CompetitorModule>> modules;
    std::optional<std::vector<std::string>> assessment_types;
    std::optional<std::vector<std::string>> delivery_methods;
};

struct CompetitorProgram {
    std::string id;
    std::string institution_name;
    std::string program_name;
    std::optional<std::string> level;
    std::vector<CompetitorTopic> topics;
    ProgramStructure structure;
    int64_t created_at = 0;   // epoch seconds
};

// Topic names in declaration order.
std::vector<std::string> topic_names(const CompetitorProgram& program);

// JSON conversions. Topics may be strings or {"name": ...} objects.
// Throws std::invalid_argument when a required field is missing.
CompetitorTopic topic_from_json(const nlohmann::json& item);
nlohmann::json topic_to_json(const CompetitorTopic& topic);
ProgramStructure structure_from_json(const nlohmann::json& item);
nlohmann::json structure_to_json(const ProgramStructure& structure);
CompetitorProgram program_from_json(const nlohmann::json& item);
nlohmann::json program_to_json(const CompetitorProgram& program);

// Abstract competitor program backend
class CompetitorStore {
public:
    virtual ~CompetitorStore() = default;

    // All programs, newest first.
    virtual std::vector<CompetitorProgram> list() = 0;

    virtual std::optional<CompetitorProgram> get(const std::string& id) = 0;

    // Store a program; id and created_at are assigned when empty.
    virtual CompetitorProgram insert(const CompetitorProgram& program) = 0;

    // Store every program in order. Returns the stored programs.
    virtual std::vector<CompetitorProgram> import_programs(
        const std::vector<CompetitorProgram>& programs) = 0;

    // Returns true if a program was removed.
    virtual bool remove(const std::string& id) = 0;
};

} // namespace curbench
