#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <vector>
#include "clock_source.hpp"
#include "timer.hpp"
#include "timer_config.hpp"

namespace polltimer {

/// TimerRegistry
/// Owns the named timers of one host. Constructed once by the host and
/// passed by reference; nothing here is global.
///
/// Single-owner: all calls must come from the thread that polls. Actions
/// run inside poll()/trigger() and may call back into the registry.
class TimerRegistry {
    struct Entry {
        std::string name;
        std::shared_ptr<Timer> timer;
    };

public:
    // --------------------------------------------------------
    // Listing: lazy (name, description) range
    // --------------------------------------------------------
    struct ListingItem {
        std::string name;
        std::string state;
    };

    class Listing {
    public:
        class const_iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type        = ListingItem;
            using difference_type   = std::ptrdiff_t;
            using pointer           = void;
            using reference         = ListingItem;

            const_iterator() = default;
            explicit const_iterator(std::vector<Entry>::const_iterator it) : it_(it) {}

            ListingItem operator*() const { return {it_->name, it_->timer->describe()}; }
            const_iterator& operator++() { ++it_; return *this; }
            const_iterator operator++(int) { auto tmp = *this; ++it_; return tmp; }
            bool operator==(const const_iterator& other) const { return it_ == other.it_; }
            bool operator!=(const const_iterator& other) const { return it_ != other.it_; }

        private:
            std::vector<Entry>::const_iterator it_;
        };

        explicit Listing(const std::vector<Entry>& entries) : entries_(&entries) {}

        const_iterator begin() const { return const_iterator(entries_->begin()); }
        const_iterator end() const { return const_iterator(entries_->end()); }
        std::size_t size() const { return entries_->size(); }

    private:
        const std::vector<Entry>* entries_;
    };

    explicit TimerRegistry(const ClockSource& clock);

    TimerRegistry(const TimerRegistry&) = delete;
    TimerRegistry& operator=(const TimerRegistry&) = delete;

    /// Build the variant picked by config.isLong and store it under name,
    /// replacing any previous timer in place. On failure the registry is
    /// left untouched.
    Timer& setup(const std::string& name, const TimerConfig& config);

    void start(const std::string& name);
    void stop(const std::string& name);

    /// Disarm, then run the action right away.
    void trigger(const std::string& name);

    void overrideExpiration(const std::string& name, std::int64_t delta);

    /// One check pass over the timers registered when the pass begins.
    /// Returns how many fired. Exceptions from actions propagate.
    std::size_t poll();

    /// Returns false if the name was not registered.
    bool remove(const std::string& name);

    bool contains(const std::string& name) const;
    std::size_t size() const { return entries_.size(); }

    /// Throws TimerError(TimerNotFound).
    Timer& at(const std::string& name);
    const Timer& at(const std::string& name) const;

    /// Valid until the registry is next modified.
    Listing list() const { return Listing(entries_); }

    const ClockSource& clock() const { return clock_; }

private:
    Entry* find(const std::string& name);
    const Entry* find(const std::string& name) const;

    std::unique_ptr<Timer> build(const TimerConfig& config) const;

    const ClockSource& clock_;
    std::vector<Entry> entries_;
};

} // namespace polltimer
