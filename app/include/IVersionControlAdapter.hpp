#pragma once
#include "Types.hpp"
#include <string>
#include <vector>

// A single move must be atomic from the adapter's point of view and keep
// the history of the moved path attributed to its new name.
class IVersionControlAdapter {
public:
    virtual ~IVersionControlAdapter() = default;
    virtual std::vector<PathEntry> list_tracked() = 0;
    virtual MoveOutcome move(const std::string& source, const std::string& target) = 0;
};
