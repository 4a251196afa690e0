#pragma once

#include <cstdint>
#include <panedock/fwd.hpp>
#include <string>

namespace panedock
{

// Source of fresh pane ids. Injected into the DockManager so hosts can swap
// in UUIDs or ids scoped to a document.
class PaneIdGenerator
{
   public:
    virtual ~PaneIdGenerator() = default;

    // Next candidate id. The registry skips candidates that are already live.
    virtual PaneId next() = 0;

    // Called for every id adopted from a restored layout so later next()
    // calls never collide with it.
    virtual void observe(const PaneId& id) = 0;
};

// "<prefix>1", "<prefix>2", ... Restored ids of the same shape advance the
// counter to at least their numeric suffix.
class SequentialPaneIdGenerator : public PaneIdGenerator
{
   public:
    explicit SequentialPaneIdGenerator(std::string prefix = "pane-");

    PaneId next() override;
    void   observe(const PaneId& id) override;

    uint64_t counter() const { return counter_; }

    // Numeric suffix of an id carrying `prefix`, or -1 if it has none.
    static int64_t numeric_suffix(const PaneId& id, const std::string& prefix);

   private:
    std::string prefix_;
    uint64_t    counter_ = 0;
};

}  // namespace panedock
