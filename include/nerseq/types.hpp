#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace nerseq {

// Arrival order of a request within one sequencer session.
using RequestId = std::uint64_t;

// Ordered mapping from entity category to its mentions in one sentence.
// Categories keep first-insertion order, mentions keep emission order.
class EntityMap {
public:
    using Entry = std::pair<std::string, std::vector<std::string>>;
    using const_iterator = std::vector<Entry>::const_iterator;

    void add(const std::string& category, std::string mention);

    [[nodiscard]] const std::vector<std::string>* find(const std::string& category) const noexcept;
    [[nodiscard]] std::vector<std::string> categories() const;

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    bool operator==(const EntityMap& other) const { return entries_ == other.entries_; }
    bool operator!=(const EntityMap& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

// One EntityMap per sentence the worker emitted, in emission order.
using ClassificationResult = std::vector<EntityMap>;

} // namespace nerseq
