#pragma once
/*
 * LogList model
 *
 * Purpose: log entries shown by LogListView plus the cursor/viewport state
 *          (scroll offset, selection, focus, search query).
 * Invariants: unselecting resets the offset to 0; the selection is not
 *             bounds-checked here, LogListView clamps it when rendering.
 */
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "input.hpp"
#include "style.hpp"

class LogListItem {
public:
  explicit LogListItem(std::string content, Style style = Style{})
    : content_(std::move(content)), style_(style) {}

  const std::string& content() const { return content_; }
  const Style& style() const { return style_; }
  size_t height(int width) const;

private:
  std::string content_;
  Style style_;
};

class LogListState {
public:
  size_t offset() const { return offset_; }
  std::optional<size_t> selected() const { return selected_; }
  bool focused() const { return focused_; }
  const std::string& find_text() const { return find_text_; }

  void select(std::optional<size_t> index);

private:
  friend class LogListModel;
  friend class LogListView;
  size_t offset_ = 0;
  std::optional<size_t> selected_;
  bool focused_ = false;
  std::string find_text_;
};

class LogListModel {
public:
  LogListModel();

  const std::vector<LogListItem>& items() const { return items_; }
  LogListState& state() { return state_; }
  const LogListState& state() const { return state_; }

  void push(LogListItem item);
  void clear();
  // Swaps in re-rendered entries; selection and offset are kept.
  void replace_items(std::vector<LogListItem> items);
  void set_find_text(std::string text);
  void select(std::optional<size_t> index) { state_.select(index); }
  void unselect() { state_.select(std::nullopt); }
  void next_if_exist();
  void previous_if_exist();
  void focus() { state_.focused_ = true; }
  void blur() { state_.focused_ = false; }
  void on_key(const KeyEvent& key);

private:
  std::vector<LogListItem> items_;
  LogListState state_;
};
