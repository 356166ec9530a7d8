#pragma once
#include <SFML/Graphics/Color.hpp>
#include <cstddef>
#include <deque>
#include <ostream>
#include <string>

/// Maximum number of history entries retained.
inline constexpr std::size_t kMaxHistory = 1000;

/// ConsoleHistory
/// Stores coloured console lines (command echoes, command results and
/// output of timer actions) and renders new ones to a terminal.
class ConsoleHistory {
public:
    struct Line {
        std::string text;
        sf::Color color{ sf::Color::White };
    };

    /// Add a new line to history (default white color).
    void push(const std::string& line, sf::Color c = sf::Color::White);

    /// Write lines pushed since the last flush. With `ansi`, colours are
    /// emitted as 24-bit escape sequences.
    void flush(std::ostream& out, bool ansi = true);

    /// Clear all history lines.
    void clear();

    const std::deque<Line>& lines() const;

private:
    std::deque<Line> raw_;
    std::size_t pending_ = 0;   // lines at the back not yet flushed
};
