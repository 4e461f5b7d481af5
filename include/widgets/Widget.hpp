#pragma once
#include "core/CellBuffer.hpp"
#include "core/Rect.hpp"

// Stateless widget: a pure transform from (area, buffer) to cell writes.
class Renderable {
public:
    virtual ~Renderable() = default;
    virtual void render(Rect area, CellBuffer& buf) const = 0;
};

// Widget that threads an external, caller-owned state (selection, scroll).
template <typename State>
class StatefulRenderable {
public:
    virtual ~StatefulRenderable() = default;
    virtual void render(Rect area, CellBuffer& buf, State& state) const = 0;
};
