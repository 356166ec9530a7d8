#include "console_history.hpp"

// Push a new line into history (with optional color)
void ConsoleHistory::push(const std::string& line, sf::Color c) {
    if (raw_.size() >= kMaxHistory) {
        raw_.pop_front(); // cap history size
    }
    raw_.push_back({ line, c });
    if (pending_ < raw_.size()) {
        ++pending_;
    }
}

// Write unflushed lines, oldest first
void ConsoleHistory::flush(std::ostream& out, bool ansi) {
    for (std::size_t i = raw_.size() - pending_; i < raw_.size(); ++i) {
        const Line& ln = raw_[i];
        if (ansi && ln.color != sf::Color::White) {
            out << "\x1b[38;2;" << static_cast<int>(ln.color.r) << ';'
                << static_cast<int>(ln.color.g) << ';'
                << static_cast<int>(ln.color.b) << 'm'
                << ln.text << "\x1b[0m\n";
        } else {
            out << ln.text << '\n';
        }
    }
    out.flush();
    pending_ = 0;
}

// Clear history
void ConsoleHistory::clear() {
    raw_.clear();
    pending_ = 0;
}

// ---------------- Accessors ----------------

const std::deque<ConsoleHistory::Line>& ConsoleHistory::lines() const {
    return raw_;
}
