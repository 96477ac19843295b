#include "ncurses_terminal.hpp"
#include <locale.h>
#include <algorithm>

NcursesTerminal::NcursesTerminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  nodelay(stdscr, TRUE);
  ESCDELAY = 25;
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(1, COLOR_CYAN, -1); // focused border
    } else {
      init_pair(1, COLOR_CYAN, COLOR_BLACK); // fallback
    }
    init_pair(2, -1, -1);
  }
}

NcursesTerminal::~NcursesTerminal() { endwin(); }

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(2));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(2));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text) {
  attron(A_REVERSE);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(A_REVERSE);
}

void NcursesTerminal::draw_box(int row, int col, int height, int width, bool focused) {
  if (height < 2 || width < 2) return;
  if (focused && has_colors()) attron(COLOR_PAIR(1));
  mvhline(row, col + 1, ACS_HLINE, width - 2);
  mvhline(row + height - 1, col + 1, ACS_HLINE, width - 2);
  mvvline(row + 1, col, ACS_VLINE, height - 2);
  mvvline(row + 1, col + width - 1, ACS_VLINE, height - 2);
  mvaddch(row, col, ACS_ULCORNER);
  mvaddch(row, col + width - 1, ACS_URCORNER);
  mvaddch(row + height - 1, col, ACS_LLCORNER);
  mvaddch(row + height - 1, col + width - 1, ACS_LRCORNER);
  if (focused && has_colors()) attroff(COLOR_PAIR(1));
  // blank the inside so the float hides what is below it
  std::string blank(static_cast<size_t>(std::max(0, width - 2)), ' ');
  for (int r = row + 1; r < row + height - 1; ++r) mvaddnstr(r, col + 1, blank.c_str(), (int)blank.size());
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

int NcursesTerminal::read_key() {
  int ch = getch();
  return ch == ERR ? -1 : ch;
}
