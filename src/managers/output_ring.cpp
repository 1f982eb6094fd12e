#include "output_ring.hpp"

OutputRing::OutputRing(size_t max_bytes)
    : max_bytes_(max_bytes) {
}

uint64_t OutputRing::append(std::string data) {
    uint64_t seq = ++last_seq_;
    bytes_ += data.size();
    chunks_.push_back({seq, std::move(data)});

    while (bytes_ > max_bytes_ && chunks_.size() > 1) {
        bytes_ -= chunks_.front().data.size();
        chunks_.pop_front();
    }
    return seq;
}

OutputSnapshot OutputRing::since(uint64_t since_seq) const {
    OutputSnapshot snap;
    snap.last_seq = last_seq_;
    for (const auto& chunk : chunks_) {
        if (chunk.seq > since_seq) snap.chunks.push_back(chunk);
    }
    return snap;
}
