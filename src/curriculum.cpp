#include "curriculum.hpp"
#include "util.hpp"
#include <stdexcept>
#include <unordered_set>

namespace curbench {

std::optional<double> Curriculum::declared_hours() const {
    if (total_hours && *total_hours > 0) return total_hours;

    double sum = 0.0;
    bool any = false;
    for (const auto& u : units) {
        if (u.hours) {
            sum += *u.hours;
            any = true;
        }
    }
    if (any && sum > 0) return sum;
    return std::nullopt;
}

std::vector<std::string> Curriculum::assessment_methods() const {
    std::vector<std::string> methods;
    std::unordered_set<std::string> seen;
    for (const auto& u : units) {
        for (const auto& m : u.assessment_methods) {
            if (seen.insert(m).second) methods.push_back(m);
        }
    }
    return methods;
}

std::vector<std::string> extract_topics(const std::vector<Unit>& units) {
    std::vector<std::string> topics;
    std::unordered_set<std::string> seen;

    auto add = [&](const std::string& t) {
        if (seen.insert(t).second) topics.push_back(t);
    };

    for (const auto& unit : units) {
        if (!unit.title.empty()) add(unit.title);
        for (const auto& fragment : split_any(unit.indicative_content, ",;.\n")) {
            std::string t = trim(fragment);
            if (t.size() > 3) add(t);
        }
    }
    return topics;
}

Curriculum curriculum_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("curriculum must be a JSON object");
    }
    Curriculum c;
    c.program_id = j.value("program_id", "");
    if (c.program_id.empty()) {
        throw std::invalid_argument("curriculum requires a program_id");
    }
    if (j.contains("total_hours") && j["total_hours"].is_number()) {
        c.total_hours = j["total_hours"].get<double>();
    }

    if (j.contains("units") && j["units"].is_array()) {
        for (const auto& item : j["units"]) {
            Unit u;
            u.unit_id = item.value("unit_id", "");
            u.module_code = item.value("module_code", "");
            u.title = item.value("title", "");
            u.indicative_content = item.value("indicative_content", "");
            if (item.contains("assessment_methods") && item["assessment_methods"].is_array()) {
                for (const auto& m : item["assessment_methods"]) {
                    if (m.is_string()) u.assessment_methods.push_back(m.get<std::string>());
                }
            }
            if (item.contains("hours") && item["hours"].is_number()) {
                u.hours = item["hours"].get<double>();
            }
            c.units.push_back(std::move(u));
        }
    }
    return c;
}

nlohmann::json curriculum_to_json(const Curriculum& c) {
    nlohmann::json units = nlohmann::json::array();
    for (const auto& u : c.units) {
        nlohmann::json item = {
            {"unit_id", u.unit_id},
            {"module_code", u.module_code},
            {"title", u.title},
            {"indicative_content", u.indicative_content},
            {"assessment_methods", u.assessment_methods}
        };
        if (u.hours) item["hours"] = *u.hours;
        units.push_back(item);
    }

    nlohmann::json j = {
        {"program_id", c.program_id},
        {"units", units}
    };
    if (c.total_hours) j["total_hours"] = *c.total_hours;
    return j;
}

} // namespace curbench
