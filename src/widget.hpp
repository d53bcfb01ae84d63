#pragma once
/*
 * Widget
 *
 * Purpose: capability every drawable component provides: render into a
 *          CellBuffer inside a Rect, optionally with mutable cursor state.
 * Design: concepts instead of a base class; the host calls render_widget()
 *         for any type that models one of them.
 */
#include <concepts>
#include "cell_buffer.hpp"
#include "types.hpp"

template <typename W>
concept Widget = requires(const W& w, const Rect& area, CellBuffer& buf) {
  { w.render(area, buf) } -> std::same_as<void>;
};

template <typename W>
concept StatefulWidget = requires(const W& w, const Rect& area, CellBuffer& buf, typename W::State& state) {
  { w.render(area, buf, state) } -> std::same_as<void>;
};

template <Widget W>
void render_widget(const W& w, const Rect& area, CellBuffer& buf) { w.render(area, buf); }

template <StatefulWidget W>
void render_widget(const W& w, const Rect& area, CellBuffer& buf, typename W::State& state) { w.render(area, buf, state); }
