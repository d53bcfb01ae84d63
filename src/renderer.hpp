#pragma once
/*
 * Renderer
 *
 * Purpose: flush a composed CellBuffer frame to the terminal.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; widgets draw into the buffer, this only copies it out
 *             as runs of equally styled cells per row. A negative cursor
 *             position hides the cursor.
 */
#include "cell_buffer.hpp"
#include "iterminal.hpp"

class Renderer {
public:
  void present(ITerminal& term, const CellBuffer& frame, int cursor_row, int cursor_col);
};
