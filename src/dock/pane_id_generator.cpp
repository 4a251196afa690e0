#include <algorithm>
#include <limits>
#include <panedock/pane_id_generator.hpp>

namespace panedock
{

SequentialPaneIdGenerator::SequentialPaneIdGenerator(std::string prefix)
    : prefix_(std::move(prefix))
{
}

PaneId SequentialPaneIdGenerator::next()
{
    return prefix_ + std::to_string(++counter_);
}

void SequentialPaneIdGenerator::observe(const PaneId& id)
{
    int64_t n = numeric_suffix(id, prefix_);
    if (n > 0)
        counter_ = std::max(counter_, static_cast<uint64_t>(n));
}

int64_t SequentialPaneIdGenerator::numeric_suffix(const PaneId& id, const std::string& prefix)
{
    if (id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0)
        return -1;

    int64_t value = 0;
    for (size_t i = prefix.size(); i < id.size(); ++i)
    {
        char c = id[i];
        if (c < '0' || c > '9')
            return -1;
        if (value > (std::numeric_limits<int64_t>::max() - 9) / 10)
            return -1;  // Overflow: not one of ours
        value = value * 10 + (c - '0');
    }
    return value;
}

}  // namespace panedock
