#include "shard/Checkpoint.hpp"
#include "shard/Errors.hpp"
#include "shard/Position.hpp"
#include <algorithm>

namespace shard {

nlohmann::json CheckpointState::toJson() const {
    return {
        {"stream_name", stream_name},
        {"partition_id", partition_id},
        {"sequence_number", sequence_number}
    };
}

std::string CheckpointState::toString() const {
    return toJson().dump();
}

CheckpointState CheckpointState::fromJson(const nlohmann::json& json) {
    if(!json.is_object())
        throw MalformedCheckpointError{"Checkpoint must be a JSON object, got " + json.dump()};

    auto field = [&json](const char* name) -> std::string {
        if(!json.contains(name))
            throw MalformedCheckpointError{"Checkpoint is missing field \"" + std::string{name} + "\""};
        if(!json[name].is_string())
            throw MalformedCheckpointError{"Checkpoint field \"" + std::string{name} + "\" must be a string"};
        return json[name].get<std::string>();
    };

    CheckpointState state;
    state.stream_name     = field("stream_name");
    state.partition_id    = field("partition_id");
    state.sequence_number = field("sequence_number");

    if(state.partition_id.empty())
        throw MalformedCheckpointError{"Checkpoint has an empty partition_id", state.stream_name};
    return state;
}

CheckpointState CheckpointState::fromString(std::string_view str) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(str);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedCheckpointError{
            "Failed to parse checkpoint: " + std::string(e.what())
        };
    }
    return fromJson(json);
}

void CheckpointTable::commit(const CheckpointState& state) {
    std::unique_lock lock{m_mutex};
    auto it = m_states.find(state.partition_id);
    if(it == m_states.end()) {
        m_states.emplace(state.partition_id, state);
        return;
    }
    if(compareSequenceNumbers(state.sequence_number, it->second.sequence_number) > 0)
        it->second = state;
}

std::vector<CheckpointState> CheckpointTable::states() const {
    std::vector<CheckpointState> result;
    {
        std::unique_lock lock{m_mutex};
        result.reserve(m_states.size());
        for(const auto& [id, state] : m_states) result.push_back(state);
    }
    std::sort(result.begin(), result.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.partition_id < rhs.partition_id;
    });
    return result;
}

}
