#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <vector>
#include <core/constants.hpp>

struct OutputChunk {
    uint64_t seq;
    std::string data;
};

struct OutputSnapshot {
    uint64_t last_seq = 0;
    std::vector<OutputChunk> chunks;
};

// Bounded replay buffer of terminal output. Sequence numbers start at 1.
// Oldest chunks are evicted once the byte cap is exceeded, but the newest
// chunk is always retained even if it alone exceeds the cap.
// Not thread-safe; the owner locks.
class OutputRing {
public:
    explicit OutputRing(size_t max_bytes = MAX_OUTPUT_BUFFER_BYTES);

    // Returns the sequence number assigned to the chunk.
    uint64_t append(std::string data);

    // Chunks with seq > since_seq.
    OutputSnapshot since(uint64_t since_seq) const;

    uint64_t last_seq() const { return last_seq_; }
    size_t size_bytes() const { return bytes_; }
    size_t chunk_count() const { return chunks_.size(); }

private:
    size_t max_bytes_;
    std::deque<OutputChunk> chunks_;
    size_t bytes_ = 0;
    uint64_t last_seq_ = 0;
};
