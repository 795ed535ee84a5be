#include "competitor.hpp"
#include "util.hpp"
#include <stdexcept>

namespace curbench {

namespace {

struct TopicNameVisitor {
    const std::string& operator()(const std::string& name) const { return name; }
    const std::string& operator()(const DetailedTopic& topic) const { return topic.name; }
};

std::optional<std::vector<std::string>> optional_strings(const nlohmann::json& obj,
                                                         const char* key) {
    if (!obj.contains(key) || !obj[key].is_array()) return std::nullopt;
    std::vector<std::string> out;
    for (const auto& v : obj[key]) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

std::optional<double> optional_number(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key) || !obj[key].is_number()) return std::nullopt;
    return obj[key].get<double>();
}

std::optional<std::string> optional_string(const nlohmann::json& obj, const char* key) {
    if (!obj.contains(key) || !obj[key].is_string()) return std::nullopt;
    return obj[key].get<std::string>();
}

} // namespace

const std::string& topic_name(const CompetitorTopic& topic) {
    return std::visit(TopicNameVisitor{}, topic);
}

std::vector<std::string> topic_names(const CompetitorProgram& program) {
    std::vector<std::string> names;
    names.reserve(program.topics.size());
    for (const auto& t : program.topics) names.push_back(topic_name(t));
    return names;
}

CompetitorTopic topic_from_json(const nlohmann::json& item) {
    if (item.is_string()) return item.get<std::string>();
    if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) {
        throw std::invalid_argument("competitor topic must be a string or an object with a name");
    }
    DetailedTopic topic;
    topic.name = item["name"].get<std::string>();
    topic.description = optional_string(item, "description");
    topic.hours = optional_number(item, "hours");
    topic.module_code = optional_string(item, "module_code");
    return topic;
}

nlohmann::json topic_to_json(const CompetitorTopic& topic) {
    if (const auto* name = std::get_if<std::string>(&topic)) return *name;

    const auto& d = std::get<DetailedTopic>(topic);
    nlohmann::json item = {{"name", d.name}};
    if (d.description) item["description"] = *d.description;
    if (d.hours) item["hours"] = *d.hours;
    if (d.module_code) item["module_code"] = *d.module_code;
    return item;
}

ProgramStructure structure_from_json(const nlohmann::json& item) {
    ProgramStructure s;
    if (!item.is_object()) return s;

    s.total_hours = optional_number(item, "total_hours");
    s.assessment_types = optional_strings(item, "assessment_types");
    s.delivery_methods = optional_strings(item, "delivery_methods");

    if (item.contains("modules") && item["modules"].is_array()) {
        std::vector<CompetitorModule> modules;
        for (const auto& m : item["modules"]) {
            if (!m.is_object()) {
                throw std::invalid_argument("competitor module must be a JSON object");
            }
            CompetitorModule mod;
            mod.code = optional_string(m, "code").value_or("");
            mod.title = optional_string(m, "title").value_or("");
            mod.hours = optional_number(m, "hours").value_or(0.0);
            if (auto topics = optional_strings(m, "topics")) mod.topics = std::move(*topics);
            modules.push_back(std::move(mod));
        }
        s.modules = std::move(modules);
    }
    return s;
}

nlohmann::json structure_to_json(const ProgramStructure& s) {
    nlohmann::json item = nlohmann::json::object();
    if (s.total_hours) item["total_hours"] = *s.total_hours;
    if (s.modules) {
        nlohmann::json modules = nlohmann::json::array();
        for (const auto& m : *s.modules) {
            modules.push_back({
                {"code", m.code},
                {"title", m.title},
                {"hours", m.hours},
                {"topics", m.topics}
            });
        }
        item["modules"] = modules;
    }
    if (s.assessment_types) item["assessment_types"] = *s.assessment_types;
    if (s.delivery_methods) item["delivery_methods"] = *s.delivery_methods;
    return item;
}

CompetitorProgram program_from_json(const nlohmann::json& item) {
    if (!item.is_object()) {
        throw std::invalid_argument("competitor program must be a JSON object");
    }
    CompetitorProgram p;
    p.id = item.value("id", "");
    p.institution_name = item.value("institution_name", "");
    p.program_name = item.value("program_name", "");
    if (p.institution_name.empty() || p.program_name.empty()) {
        throw std::invalid_argument("competitor program requires institution_name and program_name");
    }
    p.level = optional_string(item, "level");

    if (item.contains("topics") && item["topics"].is_array()) {
        for (const auto& t : item["topics"]) {
            p.topics.push_back(topic_from_json(t));
        }
    }
    if (item.contains("structure")) {
        p.structure = structure_from_json(item["structure"]);
    }
    if (item.contains("created_at")) {
        const auto& c = item["created_at"];
        int64_t epoch = 0;
        if (c.is_number_integer()) {
            p.created_at = c.get<int64_t>();
        } else if (c.is_string() && parse_date(c.get<std::string>(), epoch)) {
            p.created_at = epoch;
        }
    }
    return p;
}

nlohmann::json program_to_json(const CompetitorProgram& p) {
    nlohmann::json topics = nlohmann::json::array();
    for (const auto& t : p.topics) topics.push_back(topic_to_json(t));

    nlohmann::json item = {
        {"id", p.id},
        {"institution_name", p.institution_name},
        {"program_name", p.program_name},
        {"topics", topics},
        {"structure", structure_to_json(p.structure)},
        {"created_at", p.created_at}
    };
    item["level"] = p.level ? nlohmann::json(*p.level) : nlohmann::json(nullptr);
    return item;
}

} // namespace curbench
