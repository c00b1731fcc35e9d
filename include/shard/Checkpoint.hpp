#ifndef DIASPORA_SHARD_DRIVER_CHECKPOINT_HPP
#define DIASPORA_SHARD_DRIVER_CHECKPOINT_HPP

#include <nlohmann/json.hpp>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace shard {

/**
 * @brief Position of the last record emitted from a partition.
 *
 * Wire form: {"stream_name": ..., "partition_id": ..., "sequence_number": ...}.
 * An empty sequence_number means nothing was consumed yet.
 */
struct CheckpointState {
    std::string stream_name;
    std::string partition_id;
    std::string sequence_number;

    nlohmann::json toJson() const;

    std::string toString() const;

    /**
     * @throws MalformedCheckpointError if a field is missing, is not a
     * string, or partition_id is empty.
     */
    static CheckpointState fromJson(const nlohmann::json& json);

    static CheckpointState fromString(std::string_view str);

    friend bool operator==(const CheckpointState& lhs, const CheckpointState& rhs) {
        return lhs.stream_name == rhs.stream_name
            && lhs.partition_id == rhs.partition_id
            && lhs.sequence_number == rhs.sequence_number;
    }

    friend bool operator!=(const CheckpointState& lhs, const CheckpointState& rhs) {
        return !(lhs == rhs);
    }
};

/**
 * Thread-safe map of partition id to the furthest committed checkpoint.
 * Commits never move a partition backwards.
 */
class CheckpointTable {

    mutable std::mutex                               m_mutex;
    std::unordered_map<std::string, CheckpointState> m_states;

    public:

    void commit(const CheckpointState& state);

    std::vector<CheckpointState> states() const;
};

}

#endif
