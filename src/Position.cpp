#include "shard/Position.hpp"
#include "shard/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace shard {

static bool isNumeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c);
    });
}

static std::string stripLeadingZeros(const std::string& s) {
    auto pos = s.find_first_not_of('0');
    if(pos == std::string::npos) return "0";
    return s.substr(pos);
}

int compareSequenceNumbers(const std::string& lhs, const std::string& rhs) {
    if(isNumeric(lhs) && isNumeric(rhs)) {
        auto a = stripLeadingZeros(lhs);
        auto b = stripLeadingZeros(rhs);
        if(a.size() != b.size())
            return a.size() < b.size() ? -1 : 1;
        return a.compare(b);
    }
    return lhs.compare(rhs);
}

std::string Position::toString() const {
    switch(kind) {
        case Kind::None:           return "none";
        case Kind::Earliest:       return "earliest";
        case Kind::Latest:         return "latest";
        case Kind::SequenceNumber: return "sequence_number(" + sequence_number + ")";
        case Kind::Timestamp:      return "timestamp(" + std::to_string(timestamp) + ")";
    }
    return "unknown";
}

nlohmann::json Position::toJson() const {
    switch(kind) {
        case Kind::SequenceNumber:
            return {{"type", "sequence_number"}, {"value", sequence_number}};
        case Kind::Timestamp:
            return {{"type", "timestamp"}, {"value", timestamp}};
        default:
            return {{"type", toString()}};
    }
}

Position Position::fromJson(const nlohmann::json& json) {
    try {
        std::string type;
        if(json.is_string()) {
            type = json.get<std::string>();
        } else if(json.is_object() && json.contains("type")) {
            type = json["type"].get<std::string>();
        } else {
            throw ConfigurationError{"Invalid position: " + json.dump()};
        }

        if(type == "none")     return None();
        if(type == "earliest") return Earliest();
        if(type == "latest")   return Latest();
        if(type == "sequence_number") {
            if(!json.is_object() || !json.contains("value"))
                throw ConfigurationError{"sequence_number position requires a \"value\""};
            return AtSequenceNumber(json["value"].get<std::string>());
        }
        if(type == "timestamp") {
            if(!json.is_object() || !json.contains("value"))
                throw ConfigurationError{"timestamp position requires a \"value\""};
            return AtTimestamp(json["value"].get<int64_t>());
        }
        throw ConfigurationError{
            "Invalid position type: " + type +
            ". Valid values are: none, earliest, latest, sequence_number, timestamp"
        };
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigurationError{
            "Invalid type in position: " + std::string(e.what())
        };
    }
}

}
