#ifndef DIASPORA_SHARD_DRIVER_POSITION_HPP
#define DIASPORA_SHARD_DRIVER_POSITION_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace shard {

/**
 * @brief Position within a partition, used as a start or stop bound.
 */
struct Position {

    enum class Kind {
        None,
        Earliest,       // trim horizon
        Latest,
        SequenceNumber,
        Timestamp       // seconds since epoch
    };

    Kind        kind = Kind::None;
    std::string sequence_number;
    int64_t     timestamp = 0;

    static Position None() {
        return Position{};
    }

    static Position Earliest() {
        Position p;
        p.kind = Kind::Earliest;
        return p;
    }

    static Position Latest() {
        Position p;
        p.kind = Kind::Latest;
        return p;
    }

    static Position AtSequenceNumber(std::string seq) {
        Position p;
        p.kind = Kind::SequenceNumber;
        p.sequence_number = std::move(seq);
        return p;
    }

    static Position AtTimestamp(int64_t ts) {
        Position p;
        p.kind = Kind::Timestamp;
        p.timestamp = ts;
        return p;
    }

    bool isSequenceNumber() const {
        return kind == Kind::SequenceNumber;
    }

    std::string toString() const;

    nlohmann::json toJson() const;

    /**
     * @brief Parses either a bare string ("earliest", "latest", "none")
     * or an object {"type": ..., "value": ...}.
     *
     * @throws ConfigurationError on anything else.
     */
    static Position fromJson(const nlohmann::json& json);

    friend bool operator==(const Position& lhs, const Position& rhs) {
        return lhs.kind == rhs.kind
            && lhs.sequence_number == rhs.sequence_number
            && lhs.timestamp == rhs.timestamp;
    }
};

/**
 * @brief A partition assignment. Discovery creates splits with both bounds
 * set to None; a scheduler may fill them in before handing the split to a reader.
 */
struct Split {
    std::string partition_id;
    Position    start_position;
    Position    end_position;
};

/**
 * @brief Three-way comparison of service-issued sequence numbers.
 * All-digit sequence numbers compare numerically regardless of their
 * length, anything else compares lexicographically.
 *
 * @return negative, zero, or positive.
 */
int compareSequenceNumbers(const std::string& lhs, const std::string& rhs);

}

#endif
