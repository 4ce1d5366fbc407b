#include "../include/errors.hpp"

#include <sstream>
#include <utility>

namespace {

std::string describe_failures(const std::vector<ChunkFailure>& failures, bool tail_failed,
                              const std::string& tail_message) {
    std::ostringstream out;
    out << "transform failed for";
    if (!failures.empty()) {
        out << " " << failures.size() << " chunk(s):";
        for (const auto& f : failures) {
            out << " [chunk " << f.ordinal << ": " << f.message << "]";
        }
    }
    if (tail_failed) {
        out << (failures.empty() ? " the tail" : " and the tail");
        if (!tail_message.empty()) out << " [" << tail_message << "]";
    }
    return out.str();
}

} // namespace

TransformError::TransformError(std::vector<ChunkFailure> failures, bool tail_failed, const std::string& tail_message)
    : std::runtime_error(describe_failures(failures, tail_failed, tail_message)),
      failures_(std::move(failures)),
      tail_failed_(tail_failed) {}

std::vector<size_t> TransformError::failed_ordinals() const {
    std::vector<size_t> ordinals;
    ordinals.reserve(failures_.size());
    for (const auto& f : failures_) ordinals.push_back(f.ordinal);
    return ordinals;
}
